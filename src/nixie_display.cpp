#include "nixie_display.h"
#include "nixie_log.h"

#include <cstdarg>
#include <cstdio>

namespace SmartNixie {

const char *stateName(DisplayState state) {
    switch (state) {
        case DisplayState::Uninitialized: return "UNINITIALIZED";
        case DisplayState::Open: return "OPEN";
        case DisplayState::Closed: return "CLOSED";
    }
    return "?";
}

NixieDisplay::NixieDisplay()
    : _tubeCount(0),
      _levels{0, 0, 0, 0},
      _transport(nullptr),
      _state(DisplayState::Uninitialized),
      _settleMs(NIXIE_SETTLE_MS) {
    _fault.code = Error::Ok;
    _fault.detail[0] = '\0';
}

NixieDisplay::~NixieDisplay() {
    close();
}

Error NixieDisplay::fail(Error code, const char *fmt, ...) {
    _fault.code = code;
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(_fault.detail, sizeof(_fault.detail), fmt, ap);
    va_end(ap);
    NIXIE_LOG("Nixie", "%s: %s", errorName(code), _fault.detail);
    return code;
}

Error NixieDisplay::begin(int tubeCount, Transport *transport, const Levels &defaults) {
    if (_state != DisplayState::Uninitialized) {
        return fail(Error::InvalidArgument, "display already started");
    }
    if (tubeCount < 1) {
        return fail(Error::InvalidArgument, "tube count %d < 1", tubeCount);
    }
    if (static_cast<size_t>(tubeCount) > MAX_TUBES) {
        return fail(Error::OutOfRange, "tube count %d > %u", tubeCount, static_cast<unsigned>(MAX_TUBES));
    }
    if (!transport) {
        return fail(Error::TransportUnavailable, "no transport");
    }
    if (!levelInRange(defaults.brightness)) {
        return fail(Error::OutOfRange, "brightness %d out of range 0-255", defaults.brightness);
    }
    if (!levelInRange(defaults.red)) {
        return fail(Error::OutOfRange, "red %d out of range 0-255", defaults.red);
    }
    if (!levelInRange(defaults.green)) {
        return fail(Error::OutOfRange, "green %d out of range 0-255", defaults.green);
    }
    if (!levelInRange(defaults.blue)) {
        return fail(Error::OutOfRange, "blue %d out of range 0-255", defaults.blue);
    }
    if (!transport->open()) {
        return fail(Error::TransportUnavailable, "transport open failed");
    }

    _transport = transport;
    _tubeCount = static_cast<size_t>(tubeCount);
    for (size_t i = 0; i < MAX_TUBES; i++) {
        _tubes[i] = NixieTube();
    }
    _state = DisplayState::Open;

    setBrightness(defaults.brightness);
    setRed(defaults.red);
    setGreen(defaults.green);
    setBlue(defaults.blue);

    NIXIE_LOG("Nixie", "display open tubes=%u bri=%d rgb=%d,%d,%d",
              static_cast<unsigned>(_tubeCount),
              _levels.brightness, _levels.red, _levels.green, _levels.blue);
    return Error::Ok;
}

Error NixieDisplay::setAll(Field field, int value) {
    if (_state != DisplayState::Open) {
        return fail(Error::TransportUnavailable, "display %s", stateName(_state));
    }
    if (!levelInRange(value)) {
        return fail(Error::OutOfRange, "%s %d out of range 0-255", fieldName(field), value);
    }

    switch (field) {
        case Field::Brightness: _levels.brightness = value; break;
        case Field::Red: _levels.red = value; break;
        case Field::Green: _levels.green = value; break;
        case Field::Blue: _levels.blue = value; break;
    }
    for (size_t i = 0; i < _tubeCount; i++) {
        _tubes[i].setLevel(field, value);
    }
    return Error::Ok;
}

Error NixieDisplay::setBrightness(int value) { return setAll(Field::Brightness, value); }
Error NixieDisplay::setRed(int value) { return setAll(Field::Red, value); }
Error NixieDisplay::setGreen(int value) { return setAll(Field::Green, value); }
Error NixieDisplay::setBlue(int value) { return setAll(Field::Blue, value); }

Error NixieDisplay::setColor(int red, int green, int blue) {
    if (_state != DisplayState::Open) {
        return fail(Error::TransportUnavailable, "display %s", stateName(_state));
    }
    if (!levelInRange(red)) return fail(Error::OutOfRange, "red %d out of range 0-255", red);
    if (!levelInRange(green)) return fail(Error::OutOfRange, "green %d out of range 0-255", green);
    if (!levelInRange(blue)) return fail(Error::OutOfRange, "blue %d out of range 0-255", blue);

    setAll(Field::Red, red);
    setAll(Field::Green, green);
    return setAll(Field::Blue, blue);
}

Error NixieDisplay::reset() {
    if (_state != DisplayState::Open) {
        return fail(Error::TransportUnavailable, "display %s", stateName(_state));
    }
    // Tubes only: the display-wide levels stay as the last bulk setters left them.
    for (size_t i = 0; i < _tubeCount; i++) {
        _tubes[i].setDigit(BLANK_DIGIT);
        _tubes[i].setLevel(Field::Brightness, 0);
        _tubes[i].setLevel(Field::Red, 0);
        _tubes[i].setLevel(Field::Green, 0);
        _tubes[i].setLevel(Field::Blue, 0);
    }
    return Error::Ok;
}

Error NixieDisplay::setDisplayNumber(long number) {
    if (_state != DisplayState::Open) {
        return fail(Error::TransportUnavailable, "display %s", stateName(_state));
    }
    if (number < 0) {
        return fail(Error::InvalidArgument, "display number %ld is negative", number);
    }

    char digits[24];
    const int len = snprintf(digits, sizeof(digits), "%ld", number);
    if (len < 0 || static_cast<size_t>(len) > _tubeCount) {
        return fail(Error::OutOfRange, "not enough tubes for %ld (%u)", number,
                    static_cast<unsigned>(_tubeCount));
    }

    const size_t pad = _tubeCount - static_cast<size_t>(len);
    for (size_t i = 0; i < _tubeCount; i++) {
        _tubes[i].setDigit(i < pad ? '0' : digits[i - pad]);
    }
    return Error::Ok;
}

size_t NixieDisplay::encodeFrame(char *out, size_t outLen) const {
    if (!out || _state != DisplayState::Open || outLen < frameLength() + 1) return 0;

    // Rightmost tube first: each fragment is shifted on through the chain
    // until the latch character arrives.
    size_t pos = 0;
    for (size_t i = _tubeCount; i > 0; i--) {
        out[pos++] = '$';
        const size_t n = _tubes[i - 1].encodeFragment(out + pos, outLen - pos);
        if (n == 0) return 0;
        pos += n;
    }
    out[pos++] = '!';
    out[pos] = '\0';
    return pos;
}

Error NixieDisplay::send() {
    if (_state != DisplayState::Open || !_transport || !_transport->isOpen()) {
        return fail(Error::TransportUnavailable, "send on %s display", stateName(_state));
    }

    if (!_transport->discard()) {
        return fail(Error::TransportError, "discard failed");
    }

    char frame[MAX_FRAME_LENGTH + 1];
    const size_t len = encodeFrame(frame, sizeof(frame));
    if (len == 0) {
        return fail(Error::TransportError, "frame encoding failed");
    }
    const size_t written = _transport->write(reinterpret_cast<const uint8_t *>(frame), len);
    if (written != len) {
        return fail(Error::TransportError, "short write %u/%u",
                    static_cast<unsigned>(written), static_cast<unsigned>(len));
    }

    NIXIE_LOG("Nixie", "TX: %s", frame);
    _transport->wait(_settleMs);
    return Error::Ok;
}

void NixieDisplay::close() {
    if (_state != DisplayState::Open) return;

    reset();
    const Error err = send();
    if (err != Error::Ok) {
        NIXIE_LOG("Nixie", "blank frame on close failed: %s", errorName(err));
    }
    _transport->close();
    _transport = nullptr;
    _state = DisplayState::Closed;
    NIXIE_LOG("Nixie", "display closed");
}

NixieTube *NixieDisplay::tube(size_t index) {
    if (_state != DisplayState::Open || index >= _tubeCount) return nullptr;
    return &_tubes[index];
}

const NixieTube *NixieDisplay::tube(size_t index) const {
    if (_state != DisplayState::Open || index >= _tubeCount) return nullptr;
    return &_tubes[index];
}

} // namespace SmartNixie
