#include "ConfigManager.hpp"
#include "esp_log.h"

static const char* TAG = "ConfigManager";

ConfigManager::ConfigManager(const char* nvs_namespace) : _namespace(nvs_namespace), _nvs_handle(0), _config() {}

bool ConfigManager::begin()
{
    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_LOGW(TAG, "NVS partition was truncated, erasing and re-initializing.");
        err = nvs_flash_erase();
        if (err == ESP_OK) {
            err = nvs_flash_init();
        }
    }
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Error (%s) initializing NVS flash!", esp_err_to_name(err));
        return false;
    }
    ESP_LOGI(TAG, "NVS Flash Initialized.");
    return true;
}

bool ConfigManager::_openNVS()
{
    esp_err_t err = nvs_open(_namespace, NVS_READWRITE, &_nvs_handle);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Error (%s) opening NVS handle!", esp_err_to_name(err));
        return false;
    }
    return true;
}

void ConfigManager::_closeNVS()
{
    nvs_close(_nvs_handle);
}

bool ConfigManager::loadScaleConfig(ScaleConfig& configOut)
{
    configOut = ScaleConfig();
    if (!_openNVS()) {
        _config = configOut;
        return false;
    }

    bool success = false;
    size_t required_size;
    esp_err_t err = nvs_get_str(_nvs_handle, SCALE_CONFIG_KEY, NULL, &required_size);
    if (err == ESP_OK) {
        char* buf = new char[required_size];
        if (nvs_get_str(_nvs_handle, SCALE_CONFIG_KEY, buf, &required_size) == ESP_OK) {
            success = deserializeScaleConfig(buf, configOut);
        }
        delete[] buf;
    } else if (err == ESP_ERR_NVS_NOT_FOUND) {
        ESP_LOGW(TAG, "No scale config stored yet. Using defaults.");
    } else {
        ESP_LOGE(TAG, "Error (%s) reading scale config!", esp_err_to_name(err));
    }
    _closeNVS();

    _config = configOut;
    if (success) {
        ESP_LOGI(TAG, "Scale config loaded: DOUT=%u SCK=%u gain %u, scale %.6f, offset %lld.", configOut.doutPin, configOut.sckPin,
          configOut.gain, configOut.scale, (long long)configOut.offset);
    }
    return success;
}

bool ConfigManager::saveScaleConfig(const ScaleConfig& config)
{
    std::string jsonString;
    if (!serializeScaleConfig(config, jsonString)) {
        return false;
    }

    if (!_openNVS())
        return false;
    esp_err_t err = nvs_set_str(_nvs_handle, SCALE_CONFIG_KEY, jsonString.c_str());
    if (err == ESP_OK)
        err = nvs_commit(_nvs_handle);
    _closeNVS();

    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Error (%s) saving scale config!", esp_err_to_name(err));
        return false;
    }
    _config = config;
    ESP_LOGI(TAG, "Scale config saved (%u bytes).", (unsigned)jsonString.size());
    return true;
}

bool ConfigManager::saveCalibration(const CalibrationState& calibration, int32_t lastZeroRaw)
{
    ScaleConfig updated = _config;
    applyCalibrationToConfig(updated, calibration, lastZeroRaw);
    return saveScaleConfig(updated);
}

bool ConfigManager::saveLastZeroRaw(int32_t lastZeroRaw)
{
    ScaleConfig updated = _config;
    recordLastZeroRaw(updated, lastZeroRaw);
    return saveScaleConfig(updated);
}

bool ConfigManager::factoryReset()
{
    if (!_openNVS())
        return false;
    esp_err_t err = nvs_erase_all(_nvs_handle);
    if (err == ESP_OK) {
        err = nvs_commit(_nvs_handle);
    }
    _closeNVS();
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Error (%s) erasing NVS namespace '%s'!", esp_err_to_name(err), _namespace);
        return false;
    }
    _config = ScaleConfig();
    ESP_LOGW(TAG, "NVS namespace '%s' erased.", _namespace);
    return true;
}
