#ifndef NIXIE_TUBE_H
#define NIXIE_TUBE_H

#include "nixie_error.h"

#include <stddef.h>
#include <stdint.h>

namespace SmartNixie {

// Fields of a tube that carry a 0-255 level.
enum class Field : uint8_t {
    Brightness,
    Red,
    Green,
    Blue,
};

const char *fieldName(Field field);

// Wire fragment of one tube: "D,L,R,BBB,RRR,GGG,BBB"
static constexpr size_t FRAGMENT_LENGTH = 21;

static constexpr int LEVEL_MIN = 0;
static constexpr int LEVEL_MAX = 255;

static constexpr char BLANK_DIGIT = '-';

inline bool levelInRange(int value) {
    return value >= LEVEL_MIN && value <= LEVEL_MAX;
}

/**
 * State of one Smart Nixie Tube: digit, left/right decimal point,
 * tube brightness and the RGB backlight.
 */
class NixieTube {
public:
    NixieTube();

    // '0'-'9' or '-' for blank. Anything else blanks the tube.
    void setDigit(char digit);
    void setLeftDecimalPoint(bool on);
    void setRightDecimalPoint(bool on);

    // 0-255, OutOfRange otherwise (value kept).
    Error setBrightness(int value);
    Error setRed(int value);
    Error setGreen(int value);
    Error setBlue(int value);
    Error setLevel(Field field, int value);

    // Blank digit, decimal points off, all levels 0.
    void turnOff();

    char digit() const { return _digit; }
    bool leftDecimalPoint() const { return _leftDecimalPoint; }
    bool rightDecimalPoint() const { return _rightDecimalPoint; }
    uint8_t brightness() const { return _brightness; }
    uint8_t red() const { return _red; }
    uint8_t green() const { return _green; }
    uint8_t blue() const { return _blue; }
    uint8_t level(Field field) const;

    // Writes the NUL terminated fragment into out. Returns its length,
    // or 0 when outLen cannot hold FRAGMENT_LENGTH + 1 bytes.
    size_t encodeFragment(char *out, size_t outLen) const;

private:
    char _digit;
    bool _leftDecimalPoint;
    bool _rightDecimalPoint;
    uint8_t _brightness;
    uint8_t _red;
    uint8_t _green;
    uint8_t _blue;
};

} // namespace SmartNixie

#endif // NIXIE_TUBE_H
