/**
 * Smart Nixie Tube display controller
 * ESP32 sketch driving a chain of Smart Nixie Tubes on Serial1, with a
 * command console on the USB serial port.
 */

#include <Arduino.h>

#include "nixie_config.h"
#include "console.h"
#include "nixie_display.h"
#include "serial_transport.h"
#include "storage.h"

static SmartNixie::SerialTransport tubeLink(Serial1, NIXIE_UART_RX_PIN, NIXIE_UART_TX_PIN, NIXIE_UART_BAUD);
static SmartNixie::NixieDisplay display;
static Console::LineBuffer consoleLine;
static char consoleReply[Console::REPLY_MAX_LENGTH];

void setup() {
  Serial.begin(NIXIE_CONSOLE_BAUD);
  Serial.println("Smart Nixie Display Starting...");

  SmartNixie::Levels levels = {
      NIXIE_DEFAULT_BRIGHTNESS,
      NIXIE_DEFAULT_RED,
      NIXIE_DEFAULT_GREEN,
      NIXIE_DEFAULT_BLUE,
  };
  if (!Storage::init() || !Storage::loadLevels(levels)) {
    Serial.println("Using built-in display levels");
  }

  const SmartNixie::Error err = display.begin(NIXIE_TUBE_COUNT, &tubeLink, levels);
  if (err != SmartNixie::Error::Ok) {
    Serial.printf("Display init failed: %s (%s)\n",
                  SmartNixie::errorName(err), display.lastFault().detail);
    return;
  }

  // Tubes start blank; push that so stale data from before the reset is not shown.
  const SmartNixie::Error sendErr = display.send();
  if (sendErr != SmartNixie::Error::Ok) {
    Serial.printf("Initial frame failed: %s (%s)\n",
                  SmartNixie::errorName(sendErr), display.lastFault().detail);
  }

  Serial.printf("Display initialized, %u tubes\n", static_cast<unsigned>(display.tubeCount()));
}

void loop() {
  while (Serial.available() > 0) {
    const char c = static_cast<char>(Serial.read());
    if (!consoleLine.feed(c)) {
      continue;
    }

    const Console::Result result =
        Console::execute(consoleLine.line(), display, consoleReply, sizeof(consoleReply));
    if (result == Console::Result::Empty) {
      continue;
    }

    if (result == Console::Result::SaveRequested) {
      const SmartNixie::Levels levels = {
          display.brightness(), display.red(), display.green(), display.blue(),
      };
      if (!Storage::saveLevels(levels)) {
        snprintf(consoleReply, sizeof(consoleReply), "ERR|STORAGE|save failed");
      }
    }
    Serial.println(consoleReply);
  }
  delay(5);
}
