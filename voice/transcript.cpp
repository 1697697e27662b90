#include "voice/transcript.hpp"

#include <utility>

Turn TranscriptAccumulator::completeTurn() {
    Turn turn{std::move(user_), std::move(assistant_)};
    clear();
    return turn;
}

void TranscriptAccumulator::clear() {
    user_.clear();
    assistant_.clear();
}
