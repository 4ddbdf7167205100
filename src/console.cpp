#include "console.h"
#include "nixie_log.h"

#include <strings.h>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>

using SmartNixie::Error;
using SmartNixie::NixieDisplay;
using SmartNixie::NixieTube;

namespace Console {

static constexpr size_t FIELD_MAX_LENGTH = 24;
static constexpr size_t MAX_FIELDS = 6;

LineBuffer::LineBuffer() : _len(0), _overflow(false) {
    _buf[0] = '\0';
}

bool LineBuffer::feed(char c) {
    if (c == '\n' || c == '\r') {
        const bool complete = !_overflow && _len > 0;
        _buf[complete ? _len : 0] = '\0';
        _len = 0;
        _overflow = false;
        return complete;
    }
    if (_overflow) return false;
    if (_len < LINE_MAX_LENGTH) {
        _buf[_len++] = c;
    } else {
        NIXIE_LOG("Console", "line too long, dropped");
        _overflow = true;
        _len = 0;
    }
    return false;
}

// Copies the text up to `delim` into `out` and returns where the next token
// starts, or nullptr after the last one. `truncated` is set when the token
// did not fit.
static const char *nextToken(const char *str, char *out, size_t outLen, char delim, bool &truncated) {
    const char *end = strchr(str, delim);
    const size_t len = end ? static_cast<size_t>(end - str) : strlen(str);
    const size_t copied = len < outLen ? len : outLen - 1;
    memcpy(out, str, copied);
    out[copied] = '\0';
    truncated = copied != len;
    return end ? end + 1 : nullptr;
}

static void trimInPlace(char *text) {
    char *start = text;
    while (isspace(static_cast<unsigned char>(*start))) start++;

    size_t len = strlen(start);
    while (len > 0 && isspace(static_cast<unsigned char>(start[len - 1]))) len--;

    memmove(text, start, len);
    text[len] = '\0';
}

// Returns MAX_FIELDS + 1 when the line carries more fields than that.
// `tooLong` is set when any field overflowed FIELD_MAX_LENGTH.
static size_t splitFields(const char *line, char fields[][FIELD_MAX_LENGTH], bool &tooLong) {
    size_t count = 0;
    const char *rest = line;
    tooLong = false;
    while (rest) {
        if (count == MAX_FIELDS) return MAX_FIELDS + 1;
        bool truncated = false;
        rest = nextToken(rest, fields[count], FIELD_MAX_LENGTH, '|', truncated);
        trimInPlace(fields[count]);
        if (truncated) tooLong = true;
        count++;
    }
    return count;
}

static bool parseLong(const char *text, long &value) {
    if (!text || text[0] == '\0') return false;
    char *end = nullptr;
    errno = 0;
    const long parsed = strtol(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE) return false;
    value = parsed;
    return true;
}

static bool parseInt(const char *text, int &value) {
    long parsed = 0;
    if (!parseLong(text, parsed) || parsed < INT_MIN || parsed > INT_MAX) return false;
    value = static_cast<int>(parsed);
    return true;
}

static bool parseFlag(const char *text, bool &value) {
    if (strcasecmp(text, "Y") == 0 || strcmp(text, "1") == 0 || strcasecmp(text, "ON") == 0) {
        value = true;
        return true;
    }
    if (strcasecmp(text, "N") == 0 || strcmp(text, "0") == 0 || strcasecmp(text, "OFF") == 0) {
        value = false;
        return true;
    }
    return false;
}

static Result replyOk(char *reply, size_t replyLen) {
    snprintf(reply, replyLen, "OK");
    return Result::Ok;
}

static Result replyError(char *reply, size_t replyLen, Error code, const char *detail) {
    snprintf(reply, replyLen, "ERR|%s|%s", SmartNixie::errorName(code), detail);
    return Result::Failed;
}

// Maps a display operation's result onto the reply.
static Result replyResult(Error err, const NixieDisplay &display, char *reply, size_t replyLen) {
    if (err == Error::Ok) return replyOk(reply, replyLen);
    return replyError(reply, replyLen, err, display.lastFault().detail);
}

static bool checkArgs(size_t count, size_t expected, const char *usage, char *reply, size_t replyLen) {
    if (count == expected) return true;
    replyError(reply, replyLen, Error::InvalidArgument, usage);
    return false;
}

// Resolves a tube index field. Writes the error reply and returns nullptr
// when the index is malformed or not on the display.
static NixieTube *tubeArg(NixieDisplay &display, const char *text, char *reply, size_t replyLen) {
    long index = 0;
    if (!parseLong(text, index)) {
        replyError(reply, replyLen, Error::InvalidArgument, "tube index");
        return nullptr;
    }
    if (!display.isOpen()) {
        replyError(reply, replyLen, Error::TransportUnavailable, "display not open");
        return nullptr;
    }
    NixieTube *tube = index >= 0 ? display.tube(static_cast<size_t>(index)) : nullptr;
    if (!tube) {
        char detail[40];
        snprintf(detail, sizeof(detail), "tube %ld not in 0-%u", index,
                 static_cast<unsigned>(display.tubeCount() - 1));
        replyError(reply, replyLen, Error::OutOfRange, detail);
    }
    return tube;
}

static Result setTubeLevels(NixieDisplay &display, char fields[][FIELD_MAX_LENGTH], char *reply, size_t replyLen) {
    static const SmartNixie::Field LEVEL_FIELDS[] = {
        SmartNixie::Field::Brightness,
        SmartNixie::Field::Red,
        SmartNixie::Field::Green,
        SmartNixie::Field::Blue,
    };

    NixieTube *tube = tubeArg(display, fields[1], reply, replyLen);
    if (!tube) return Result::Failed;

    int levels[4];
    for (size_t i = 0; i < 4; i++) {
        const char *name = SmartNixie::fieldName(LEVEL_FIELDS[i]);
        if (!parseInt(fields[2 + i], levels[i])) {
            return replyError(reply, replyLen, Error::InvalidArgument, name);
        }
        if (!SmartNixie::levelInRange(levels[i])) {
            char detail[40];
            snprintf(detail, sizeof(detail), "%s %d out of range 0-255", name, levels[i]);
            return replyError(reply, replyLen, Error::OutOfRange, detail);
        }
    }
    for (size_t i = 0; i < 4; i++) {
        tube->setLevel(LEVEL_FIELDS[i], levels[i]);
    }
    return replyOk(reply, replyLen);
}

static Result replyStatus(const NixieDisplay &display, char *reply, size_t replyLen) {
    snprintf(reply, replyLen, "OK|tubes=%u|bri=%d|rgb=%d,%d,%d|state=%s|fault=%s",
             static_cast<unsigned>(display.tubeCount()),
             display.brightness(), display.red(), display.green(), display.blue(),
             SmartNixie::stateName(display.state()),
             SmartNixie::errorName(display.lastFault().code));
    return Result::Ok;
}

static Result replyFrame(const NixieDisplay &display, char *reply, size_t replyLen) {
    if (!display.isOpen()) {
        return replyError(reply, replyLen, Error::TransportUnavailable, "display not open");
    }
    char frame[SmartNixie::MAX_FRAME_LENGTH + 1];
    display.encodeFrame(frame, sizeof(frame));
    snprintf(reply, replyLen, "OK|%s", frame);
    return Result::Ok;
}

Result execute(const char *line, NixieDisplay &display, char *reply, size_t replyLen) {
    if (!reply || replyLen == 0) return Result::Failed;
    reply[0] = '\0';
    if (!line) return Result::Empty;
    while (isspace(static_cast<unsigned char>(*line))) line++;
    if (*line == '\0') return Result::Empty;

    char fields[MAX_FIELDS][FIELD_MAX_LENGTH];
    bool tooLong = false;
    const size_t count = splitFields(line, fields, tooLong);
    if (count == 0 || (fields[0][0] == '\0' && !tooLong)) return Result::Empty;
    if (tooLong) {
        return replyError(reply, replyLen, Error::InvalidArgument, "field too long");
    }

    NIXIE_LOG("Console", "RX: %s", line);
    const char *cmd = fields[0];

    if (strcasecmp(cmd, "NUM") == 0) {
        if (!checkArgs(count, 2, "NUM|n", reply, replyLen)) return Result::Failed;
        long number = 0;
        if (!parseLong(fields[1], number)) {
            return replyError(reply, replyLen, Error::InvalidArgument, "number");
        }
        return replyResult(display.setDisplayNumber(number), display, reply, replyLen);
    }

    if (strcasecmp(cmd, "DIGIT") == 0) {
        if (!checkArgs(count, 3, "DIGIT|i|c", reply, replyLen)) return Result::Failed;
        NixieTube *tube = tubeArg(display, fields[1], reply, replyLen);
        if (!tube) return Result::Failed;
        if (strlen(fields[2]) != 1) {
            return replyError(reply, replyLen, Error::InvalidArgument, "digit must be one character");
        }
        tube->setDigit(fields[2][0]);
        return replyOk(reply, replyLen);
    }

    if (strcasecmp(cmd, "DP") == 0) {
        if (!checkArgs(count, 4, "DP|i|L|R", reply, replyLen)) return Result::Failed;
        NixieTube *tube = tubeArg(display, fields[1], reply, replyLen);
        if (!tube) return Result::Failed;
        bool left = false;
        bool right = false;
        if (!parseFlag(fields[2], left)) {
            return replyError(reply, replyLen, Error::InvalidArgument, "left decimal point must be Y or N");
        }
        if (!parseFlag(fields[3], right)) {
            return replyError(reply, replyLen, Error::InvalidArgument, "right decimal point must be Y or N");
        }
        tube->setLeftDecimalPoint(left);
        tube->setRightDecimalPoint(right);
        return replyOk(reply, replyLen);
    }

    if (strcasecmp(cmd, "BRI") == 0) {
        if (!checkArgs(count, 2, "BRI|n", reply, replyLen)) return Result::Failed;
        int value = 0;
        if (!parseInt(fields[1], value)) {
            return replyError(reply, replyLen, Error::InvalidArgument, "brightness");
        }
        return replyResult(display.setBrightness(value), display, reply, replyLen);
    }

    if (strcasecmp(cmd, "RGB") == 0) {
        if (!checkArgs(count, 4, "RGB|r|g|b", reply, replyLen)) return Result::Failed;
        int red = 0;
        int green = 0;
        int blue = 0;
        if (!parseInt(fields[1], red) || !parseInt(fields[2], green) || !parseInt(fields[3], blue)) {
            return replyError(reply, replyLen, Error::InvalidArgument, "colour");
        }
        return replyResult(display.setColor(red, green, blue), display, reply, replyLen);
    }

    if (strcasecmp(cmd, "TUBE") == 0) {
        if (!checkArgs(count, 6, "TUBE|i|bri|r|g|b", reply, replyLen)) return Result::Failed;
        return setTubeLevels(display, fields, reply, replyLen);
    }

    if (strcasecmp(cmd, "OFF") == 0) {
        if (!checkArgs(count, 2, "OFF|i", reply, replyLen)) return Result::Failed;
        NixieTube *tube = tubeArg(display, fields[1], reply, replyLen);
        if (!tube) return Result::Failed;
        tube->turnOff();
        return replyOk(reply, replyLen);
    }

    if (strcasecmp(cmd, "RESET") == 0) {
        if (!checkArgs(count, 1, "RESET", reply, replyLen)) return Result::Failed;
        return replyResult(display.reset(), display, reply, replyLen);
    }

    if (strcasecmp(cmd, "SEND") == 0) {
        if (!checkArgs(count, 1, "SEND", reply, replyLen)) return Result::Failed;
        return replyResult(display.send(), display, reply, replyLen);
    }

    if (strcasecmp(cmd, "FRAME") == 0) {
        if (!checkArgs(count, 1, "FRAME", reply, replyLen)) return Result::Failed;
        return replyFrame(display, reply, replyLen);
    }

    if (strcasecmp(cmd, "STATUS") == 0) {
        if (!checkArgs(count, 1, "STATUS", reply, replyLen)) return Result::Failed;
        return replyStatus(display, reply, replyLen);
    }

    if (strcasecmp(cmd, "SAVE") == 0) {
        if (!checkArgs(count, 1, "SAVE", reply, replyLen)) return Result::Failed;
        if (!display.isOpen()) {
            return replyError(reply, replyLen, Error::TransportUnavailable, "display not open");
        }
        replyOk(reply, replyLen);
        return Result::SaveRequested;
    }

    NIXIE_LOG("Console", "Unknown command: %s", cmd);
    snprintf(reply, replyLen, "ERR|UNKNOWN|%s", cmd);
    return Result::Unknown;
}

} // namespace Console
