#include "storage.h"

#include <LittleFS.h>

namespace Storage {

static const char *SETTINGS_FILE = "/nixie.bin";
static const char *SETTINGS_TMP_FILE = "/nixie.tmp";
static constexpr uint32_t SETTINGS_MAGIC = 0x4E495831; // "NIX1"
static constexpr uint8_t SETTINGS_VERSION = 1;

#ifndef STORAGE_FORMAT_FS_ON_BOOT
#define STORAGE_FORMAT_FS_ON_BOOT 0
#endif

struct SettingsRecord {
    uint32_t magic;
    uint8_t version;
    uint8_t brightness;
    uint8_t red;
    uint8_t green;
    uint8_t blue;
    uint8_t reserved[3];
};

static void dumpSettingsHex(const char *path) {
    File f = LittleFS.open(path, FILE_READ);
    if (!f) {
        Serial.printf("Storage::dump %s: open failed\n", path);
        return;
    }

    Serial.printf("Storage::dump %s: size=%u bytes\n", path, static_cast<unsigned>(f.size()));

    uint8_t buf[sizeof(SettingsRecord)];
    const size_t got = f.read(buf, sizeof(buf));
    Serial.print("  0000: ");
    for (size_t i = 0; i < got; ++i) {
        Serial.printf("%02X ", buf[i]);
    }
    Serial.println();

    f.close();
}

bool init() {
#if STORAGE_FORMAT_FS_ON_BOOT
    Serial.println("Formatting LittleFS (STORAGE_FORMAT_FS_ON_BOOT)");
    LittleFS.format();
#endif
    if (!LittleFS.begin(true)) {
        Serial.println("LittleFS Mount Failed");
        return false;
    }
    Serial.println("LittleFS Mounted");
    return true;
}

bool loadLevels(SmartNixie::Levels &levels) {
    if (!LittleFS.exists(SETTINGS_FILE)) {
        Serial.println("No settings file found, using defaults.");
        return false;
    }

    dumpSettingsHex(SETTINGS_FILE);

    File file = LittleFS.open(SETTINGS_FILE, FILE_READ);
    if (!file) {
        Serial.println("Failed to open settings file for reading");
        return false;
    }

    if (static_cast<size_t>(file.size()) != sizeof(SettingsRecord)) {
        Serial.printf("Corrupt settings file: size=%u expected=%u\n",
                      static_cast<unsigned>(file.size()),
                      static_cast<unsigned>(sizeof(SettingsRecord)));
        file.close();
        return false;
    }

    SettingsRecord record;
    if (file.read((uint8_t *)&record, sizeof(record)) != sizeof(record)) {
        Serial.println("Failed to read settings record");
        file.close();
        return false;
    }
    file.close();

    if (record.magic != SETTINGS_MAGIC || record.version != SETTINGS_VERSION) {
        Serial.printf("Unknown settings record (magic=%08lX version=%u), using defaults.\n",
                      static_cast<unsigned long>(record.magic),
                      static_cast<unsigned>(record.version));
        return false;
    }

    levels.brightness = record.brightness;
    levels.red = record.red;
    levels.green = record.green;
    levels.blue = record.blue;
    Serial.printf("Loaded settings bri=%d rgb=%d,%d,%d\n",
                  levels.brightness, levels.red, levels.green, levels.blue);
    return true;
}

bool saveLevels(const SmartNixie::Levels &levels) {
    if (!SmartNixie::levelInRange(levels.brightness) || !SmartNixie::levelInRange(levels.red) ||
        !SmartNixie::levelInRange(levels.green) || !SmartNixie::levelInRange(levels.blue)) {
        Serial.println("Refusing to save out of range settings");
        return false;
    }

    SettingsRecord record = {};
    record.magic = SETTINGS_MAGIC;
    record.version = SETTINGS_VERSION;
    record.brightness = static_cast<uint8_t>(levels.brightness);
    record.red = static_cast<uint8_t>(levels.red);
    record.green = static_cast<uint8_t>(levels.green);
    record.blue = static_cast<uint8_t>(levels.blue);

    if (LittleFS.exists(SETTINGS_TMP_FILE)) {
        LittleFS.remove(SETTINGS_TMP_FILE);
    }

    File file = LittleFS.open(SETTINGS_TMP_FILE, FILE_WRITE);
    if (!file) {
        Serial.println("Failed to open temporary settings file for writing");
        return false;
    }

    if (file.write((const uint8_t *)&record, sizeof(record)) != sizeof(record)) {
        Serial.println("Failed to write settings to temporary file");
        file.close();
        LittleFS.remove(SETTINGS_TMP_FILE);
        return false;
    }

    file.flush();
    file.close();

    File check = LittleFS.open(SETTINGS_TMP_FILE, FILE_READ);
    if (!check) {
        Serial.println("Failed to reopen temporary settings file for validation");
        LittleFS.remove(SETTINGS_TMP_FILE);
        return false;
    }
    const size_t actualSize = static_cast<size_t>(check.size());
    check.close();

    if (actualSize != sizeof(record)) {
        Serial.printf("Temporary settings file size mismatch (%u/%u), aborting commit\n",
                      static_cast<unsigned>(actualSize),
                      static_cast<unsigned>(sizeof(record)));
        LittleFS.remove(SETTINGS_TMP_FILE);
        return false;
    }

    if (LittleFS.exists(SETTINGS_FILE)) {
        if (!LittleFS.remove(SETTINGS_FILE)) {
            Serial.println("Failed to remove old settings file");
            LittleFS.remove(SETTINGS_TMP_FILE);
            return false;
        }
    }

    if (!LittleFS.rename(SETTINGS_TMP_FILE, SETTINGS_FILE)) {
        Serial.println("Failed to commit temporary settings file");
        LittleFS.remove(SETTINGS_TMP_FILE);
        return false;
    }

    Serial.printf("Saved settings bri=%d rgb=%d,%d,%d (atomic).\n",
                  levels.brightness, levels.red, levels.green, levels.blue);
    return true;
}

} // namespace Storage
