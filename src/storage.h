#ifndef STORAGE_H
#define STORAGE_H

#include "nixie_display.h"

#include <Arduino.h>

namespace Storage {

bool init();

// Leaves levels untouched and returns false when nothing valid is stored.
bool loadLevels(SmartNixie::Levels &levels);
bool saveLevels(const SmartNixie::Levels &levels);

} // namespace Storage

#endif // STORAGE_H
