#ifndef SERIAL_TRANSPORT_H
#define SERIAL_TRANSPORT_H

#include "nixie_transport.h"

#include <Arduino.h>
#include <stdint.h>

namespace SmartNixie {

// Tube chain on a hardware UART, 8N1.
class SerialTransport : public Transport {
public:
    SerialTransport(HardwareSerial &serial, int rxPin, int txPin, uint32_t baud = 115200);

    bool open() override;
    bool isOpen() const override { return _open; }
    bool discard() override;
    size_t write(const uint8_t *data, size_t len) override;
    void wait(uint32_t ms) override;
    void close() override;

private:
    HardwareSerial &_uart;
    int _rxPin;
    int _txPin;
    uint32_t _baud;
    bool _open;
};

} // namespace SmartNixie

#endif // SERIAL_TRANSPORT_H
