#pragma once
#include <string>

struct Turn {
    std::string user;
    std::string assistant;
};

/// Per-turn text buffers. Append-only until completeTurn() empties them.
class TranscriptAccumulator {
public:
    void appendUser(const std::string& delta) { user_ += delta; }
    void appendAssistant(const std::string& delta) { assistant_ += delta; }

    /// Hand back the finished turn and start a fresh one.
    Turn completeTurn();
    void clear();

    const std::string& user() const { return user_; }
    const std::string& assistant() const { return assistant_; }

private:
    std::string user_;
    std::string assistant_;
};
