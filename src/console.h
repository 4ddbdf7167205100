#ifndef CONSOLE_H
#define CONSOLE_H

#include "nixie_display.h"

#include <stddef.h>
#include <stdint.h>

namespace Console {

static constexpr size_t LINE_MAX_LENGTH = 128;
static constexpr size_t REPLY_MAX_LENGTH = SmartNixie::MAX_FRAME_LENGTH + 16;

enum class Result : uint8_t {
    Ok,
    SaveRequested,   // settings must be persisted by the caller
    Failed,
    Unknown,
    Empty,
};

// Collects console bytes into lines. Over-long lines are dropped whole.
class LineBuffer {
public:
    LineBuffer();

    // True when c completed a non-empty line, available from line().
    bool feed(char c);
    const char *line() const { return _buf; }

private:
    char _buf[LINE_MAX_LENGTH + 1];
    size_t _len;
    bool _overflow;
};

// Runs one command line against the display. The reply ("OK", "OK|...",
// "ERR|<ERROR>|<detail>") is written to reply.
Result execute(const char *line, SmartNixie::NixieDisplay &display, char *reply, size_t replyLen);

} // namespace Console

#endif // CONSOLE_H
