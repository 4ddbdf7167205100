#ifndef NIXIE_TRANSPORT_H
#define NIXIE_TRANSPORT_H

#include <stddef.h>
#include <stdint.h>

namespace SmartNixie {

// Byte channel to the first tube of the chain.
class Transport {
public:
    virtual ~Transport() {}

    // Returns false when the link cannot be opened.
    virtual bool open() = 0;
    virtual bool isOpen() const = 0;

    // Drops pending inbound and outbound bytes.
    virtual bool discard() = 0;

    // Returns the number of bytes accepted.
    virtual size_t write(const uint8_t *data, size_t len) = 0;

    // Blocks the caller for ms milliseconds.
    virtual void wait(uint32_t ms) = 0;

    virtual void close() = 0;
};

} // namespace SmartNixie

#endif // NIXIE_TRANSPORT_H
