#ifndef NIXIE_DISPLAY_H
#define NIXIE_DISPLAY_H

#include "nixie_config.h"
#include "nixie_error.h"
#include "nixie_transport.h"
#include "nixie_tube.h"

#include <stddef.h>
#include <stdint.h>

namespace SmartNixie {

static constexpr size_t MAX_TUBES = NIXIE_MAX_TUBES;

// '$' + fragment per tube, then '!'
static constexpr size_t frameLength(size_t tubeCount) {
    return tubeCount * (FRAGMENT_LENGTH + 1) + 1;
}

static constexpr size_t MAX_FRAME_LENGTH = frameLength(MAX_TUBES);

// Display-wide levels applied to every tube.
struct Levels {
    int brightness;
    int red;
    int green;
    int blue;
};

struct Fault {
    Error code;
    char detail[64];
};

enum class DisplayState : uint8_t {
    Uninitialized,
    Open,
    Closed,
};

const char *stateName(DisplayState state);

/**
 * A chain of Smart Nixie Tubes driven over one serial link.
 *
 * Tube 0 is the leftmost tube as installed. Serial data enters the chain at
 * the left and is shifted to the right, so the frame carries the rightmost
 * tube first and is latched by the trailing '!'.
 *
 * Usage:
 *   display.begin(6, &transport, levels);
 *   display.setDisplayNumber(42);
 *   display.send();
 *   ...
 *   display.close();   // also run by the destructor
 */
class NixieDisplay {
public:
    NixieDisplay();
    ~NixieDisplay();

    NixieDisplay(const NixieDisplay &) = delete;
    NixieDisplay &operator=(const NixieDisplay &) = delete;

    Error begin(int tubeCount, Transport *transport, const Levels &defaults);

    // Overwrite the field on every tube.
    Error setBrightness(int value);
    Error setRed(int value);
    Error setGreen(int value);
    Error setBlue(int value);
    Error setColor(int red, int green, int blue);

    // Blanks every digit and zeroes brightness and colour. Decimal points
    // keep their state.
    Error reset();

    // Most significant digit goes to tube 0, zero padded to the tube count.
    Error setDisplayNumber(long number);

    // Writes the NUL terminated frame into out and returns its length,
    // 0 when not open or outLen is smaller than frameLength() + 1.
    size_t encodeFrame(char *out, size_t outLen) const;

    // Discard, write the frame, wait settleMs().
    Error send();

    // Blank frame, then release the transport. Never fails.
    void close();

    NixieTube *tube(size_t index);
    const NixieTube *tube(size_t index) const;

    size_t tubeCount() const { return _tubeCount; }
    size_t frameLength() const { return SmartNixie::frameLength(_tubeCount); }
    int brightness() const { return _levels.brightness; }
    int red() const { return _levels.red; }
    int green() const { return _levels.green; }
    int blue() const { return _levels.blue; }
    DisplayState state() const { return _state; }
    bool isOpen() const { return _state == DisplayState::Open; }

    uint32_t settleMs() const { return _settleMs; }
    void setSettleMs(uint32_t ms) { _settleMs = ms; }

    const Fault &lastFault() const { return _fault; }

private:
    Error setAll(Field field, int value);
    Error fail(Error code, const char *fmt, ...);

    NixieTube _tubes[MAX_TUBES];
    size_t _tubeCount;
    Levels _levels;
    Transport *_transport;
    DisplayState _state;
    uint32_t _settleMs;
    Fault _fault;
};

} // namespace SmartNixie

#endif // NIXIE_DISPLAY_H
