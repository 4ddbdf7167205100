#include "serial_transport.h"
#include "nixie_log.h"

namespace SmartNixie {

SerialTransport::SerialTransport(HardwareSerial &serial, int rxPin, int txPin, uint32_t baud)
    : _uart(serial), _rxPin(rxPin), _txPin(txPin), _baud(baud), _open(false) {}

bool SerialTransport::open() {
    if (_open) return true;
    _uart.begin(_baud, SERIAL_8N1, _rxPin, _txPin);
    if (!_uart) {
        NIXIE_LOG("Uart", "open failed RX=%d TX=%d", _rxPin, _txPin);
        return false;
    }
    _open = true;
    NIXIE_LOG("Uart", "UART init RX=%d TX=%d baud=%lu", _rxPin, _txPin, static_cast<unsigned long>(_baud));
    return true;
}

bool SerialTransport::discard() {
    if (!_open) return false;
    // Finish anything still queued for transmit, then drop unread input.
    _uart.flush();
    while (_uart.available() > 0) {
        _uart.read();
    }
    return true;
}

size_t SerialTransport::write(const uint8_t *data, size_t len) {
    if (!_open || !data) return 0;
    return _uart.write(data, len);
}

void SerialTransport::wait(uint32_t ms) {
    delay(ms);
}

void SerialTransport::close() {
    if (!_open) return;
    _uart.flush();
    _uart.end();
    _open = false;
    NIXIE_LOG("Uart", "UART closed");
}

} // namespace SmartNixie
