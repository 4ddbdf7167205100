#ifndef NIXIE_LOG_H
#define NIXIE_LOG_H

#ifndef NIXIE_DEBUG
#define NIXIE_DEBUG 1
#endif

#if NIXIE_DEBUG
#include <Arduino.h>
#define NIXIE_LOG(tag, fmt, ...) do { Serial.printf("[" tag "] " fmt "\n", ##__VA_ARGS__); } while (0)
#else
#define NIXIE_LOG(tag, fmt, ...) do {} while (0)
#endif

#endif // NIXIE_LOG_H
