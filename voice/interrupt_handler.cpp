#include "voice/interrupt_handler.hpp"
#include "voice/playback_scheduler.hpp"
#include "logger.hpp"

void InterruptHandler::onInterrupted() {
    scheduler_.stopAll();
    scheduler_.resetCursor();
    count_++;
    LOG_DEBUG("Interrupt", "Playback interrupted (#" + std::to_string(count_) + ")");
}
