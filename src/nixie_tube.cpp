#include "nixie_tube.h"
#include "nixie_log.h"

#include <cstdio>

namespace SmartNixie {

const char *fieldName(Field field) {
    switch (field) {
        case Field::Brightness: return "brightness";
        case Field::Red: return "red";
        case Field::Green: return "green";
        case Field::Blue: return "blue";
    }
    return "?";
}

static bool isDigitChar(char c) {
    return (c >= '0' && c <= '9') || c == BLANK_DIGIT;
}

static char yn(bool on) {
    return on ? 'Y' : 'N';
}

NixieTube::NixieTube()
    : _digit(BLANK_DIGIT),
      _leftDecimalPoint(false),
      _rightDecimalPoint(false),
      _brightness(0),
      _red(0),
      _green(0),
      _blue(0) {}

void NixieTube::setDigit(char digit) {
    _digit = isDigitChar(digit) ? digit : BLANK_DIGIT;
}

void NixieTube::setLeftDecimalPoint(bool on) { _leftDecimalPoint = on; }
void NixieTube::setRightDecimalPoint(bool on) { _rightDecimalPoint = on; }

Error NixieTube::setLevel(Field field, int value) {
    if (!levelInRange(value)) {
        NIXIE_LOG("Nixie", "%s %d out of range 0-255", fieldName(field), value);
        return Error::OutOfRange;
    }
    const uint8_t level = static_cast<uint8_t>(value);
    switch (field) {
        case Field::Brightness: _brightness = level; break;
        case Field::Red: _red = level; break;
        case Field::Green: _green = level; break;
        case Field::Blue: _blue = level; break;
    }
    return Error::Ok;
}

Error NixieTube::setBrightness(int value) { return setLevel(Field::Brightness, value); }
Error NixieTube::setRed(int value) { return setLevel(Field::Red, value); }
Error NixieTube::setGreen(int value) { return setLevel(Field::Green, value); }
Error NixieTube::setBlue(int value) { return setLevel(Field::Blue, value); }

uint8_t NixieTube::level(Field field) const {
    switch (field) {
        case Field::Brightness: return _brightness;
        case Field::Red: return _red;
        case Field::Green: return _green;
        case Field::Blue: return _blue;
    }
    return 0;
}

void NixieTube::turnOff() {
    _digit = BLANK_DIGIT;
    _leftDecimalPoint = false;
    _rightDecimalPoint = false;
    _brightness = 0;
    _red = 0;
    _green = 0;
    _blue = 0;
}

size_t NixieTube::encodeFragment(char *out, size_t outLen) const {
    if (!out || outLen < FRAGMENT_LENGTH + 1) return 0;

    int written = snprintf(
        out,
        outLen,
        "%c,%c,%c,%03u,%03u,%03u,%03u",
        _digit,
        yn(_leftDecimalPoint),
        yn(_rightDecimalPoint),
        static_cast<unsigned>(_brightness),
        static_cast<unsigned>(_red),
        static_cast<unsigned>(_green),
        static_cast<unsigned>(_blue)
    );
    if (written != static_cast<int>(FRAGMENT_LENGTH)) return 0;
    return FRAGMENT_LENGTH;
}

} // namespace SmartNixie
