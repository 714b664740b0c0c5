/**
 * @file settings_flash.cpp
 * @brief HubLink settings - InternalFS persistence
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "settings_store.h"
#include <Adafruit_LittleFS.h>
#include <InternalFileSystem.h>

using namespace Adafruit_LittleFS_Namespace;

bool SettingsStore::begin() {
    if (InternalFS.begin()) {
        _storageAvailable = true;
        Serial.println(F("[SETTINGS] InternalFS mounted"));
        load();
    } else {
        _storageAvailable = false;
        Serial.println(F("[SETTINGS] InternalFS not available, using defaults"));
    }
    return _storageAvailable;
}

bool SettingsStore::save() {
    if (!_storageAvailable) {
        Serial.println(F("[SETTINGS] Storage not available"));
        return false;
    }

    SettingsData data;
    encode(data);

    // FILE_O_WRITE positions at EOF, so seek(0) to overwrite
    File file(InternalFS);
    if (!file.open(SETTINGS_FILE, FILE_O_WRITE)) {
        Serial.println(F("[SETTINGS] Failed to open file for writing"));
        return false;
    }
    file.seek(0);

    size_t written = file.write((uint8_t*)&data, sizeof(data));
    file.flush();
    file.close();

    if (written != sizeof(data)) {
        Serial.println(F("[SETTINGS] Write failed"));
        return false;
    }

    Serial.println(F("[SETTINGS] Saved"));
    return true;
}

bool SettingsStore::load() {
    if (!_storageAvailable) {
        return false;
    }

    if (!InternalFS.exists(SETTINGS_FILE)) {
        Serial.println(F("[SETTINGS] No settings file found"));
        return false;
    }

    File file(InternalFS);
    if (!file.open(SETTINGS_FILE, FILE_O_READ)) {
        Serial.println(F("[SETTINGS] Failed to open file"));
        return false;
    }

    SettingsData data;
    size_t bytesRead = file.read((uint8_t*)&data, sizeof(data));
    file.close();

    if (bytesRead != sizeof(data)) {
        Serial.println(F("[SETTINGS] Invalid file format"));
        return false;
    }

    if (!decode(data)) {
        return false;
    }

    Serial.printf("[SETTINGS] Loaded: adapter=%u retries=%u delay=%lu\n",
                  _settings.adapterIndex, _settings.connectRetries,
                  (unsigned long)_settings.retryDelayMs);
    return true;
}
