#ifndef CONFIGMANAGER_HPP
#define CONFIGMANAGER_HPP

#include <string>
#include "nvs_flash.h"
#include "nvs.h"
#include "CalibrationStore.hpp"
#include "ScaleConfig.hpp"

/**
 * @brief Keeps the ScaleConfig as one JSON blob in NVS, plus an in-memory copy of what was last loaded or saved.
 */
class ConfigManager : public CalibrationStore {
public:
    ConfigManager(const char* nvs_namespace);
    bool begin();

    /**
     * @brief Reads the stored settings. Missing or corrupted data yields the defaults.
     * @return <false> when the defaults had to be used.
     */
    bool loadScaleConfig(ScaleConfig& configOut);
    bool saveScaleConfig(const ScaleConfig& config);
    ScaleConfig getConfig() const { return _config; }

    bool saveCalibration(const CalibrationState& calibration, int32_t lastZeroRaw) override;
    bool saveLastZeroRaw(int32_t lastZeroRaw);

    // Factory Reset
    bool factoryReset();

private:
    const char* _namespace;
    nvs_handle_t _nvs_handle;
    ScaleConfig _config;

    static constexpr const char* SCALE_CONFIG_KEY = "scale_cfg";

    bool _openNVS();
    void _closeNVS();
};

#endif // CONFIGMANAGER_HPP
