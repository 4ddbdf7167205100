/*******************************************************************************
 * Smart Nixie Tube board configuration.
 * Driver boards: http://switchmodedesign.com/products/smart-nixie-tube
 *
 * Every value can be overridden from the build (-D...).
 ******************************************************************************/

#ifndef NIXIE_CONFIG_H
#define NIXIE_CONFIG_H

// Tubes installed in the chain
#ifndef NIXIE_TUBE_COUNT
#define NIXIE_TUBE_COUNT 6
#endif

// Upper bound for the static tube storage of a display
#ifndef NIXIE_MAX_TUBES
#define NIXIE_MAX_TUBES 16
#endif

// UART wired to the first tube's serial input
#ifndef NIXIE_UART_RX_PIN
#define NIXIE_UART_RX_PIN 16
#endif
#ifndef NIXIE_UART_TX_PIN
#define NIXIE_UART_TX_PIN 17
#endif
#ifndef NIXIE_UART_BAUD
#define NIXIE_UART_BAUD 115200
#endif

// Time the tubes need to latch a frame before the next one
#ifndef NIXIE_SETTLE_MS
#define NIXIE_SETTLE_MS 100
#endif

// Used when no settings file is stored yet
#ifndef NIXIE_DEFAULT_BRIGHTNESS
#define NIXIE_DEFAULT_BRIGHTNESS 128
#endif
#ifndef NIXIE_DEFAULT_RED
#define NIXIE_DEFAULT_RED 0
#endif
#ifndef NIXIE_DEFAULT_GREEN
#define NIXIE_DEFAULT_GREEN 0
#endif
#ifndef NIXIE_DEFAULT_BLUE
#define NIXIE_DEFAULT_BLUE 255
#endif

// USB console
#ifndef NIXIE_CONSOLE_BAUD
#define NIXIE_CONSOLE_BAUD 115200
#endif

#endif // NIXIE_CONFIG_H
