/**
 * WakeWordDetector.hpp - Porcupine wake word detection
 *
 * Fed with capture frames while the microphone gate is Monitoring.
 * Built only with SUI_HAS_PORCUPINE.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sui::wakeword {

struct WakeWordConfig {
    bool enabled = false;
    std::string access_key;
    std::string model_path;
    std::vector<std::string> keyword_paths;
    std::vector<float> sensitivities;   // 0.5 per keyword if empty
};

class WakeWordDetector {
public:
    using WakeWordCallback = std::function<void(int keyword_index)>;

    explicit WakeWordDetector(const WakeWordConfig& config);
    ~WakeWordDetector();

    WakeWordDetector(const WakeWordDetector&) = delete;
    WakeWordDetector& operator=(const WakeWordDetector&) = delete;

    bool isReady() const;
    const std::string& lastError() const;

    int getFrameLength() const;
    int getSampleRate() const;

    /**
     * One Porcupine frame of getFrameLength() samples.
     * @return keyword index, or -1
     */
    int process(const int16_t* samples);

    /**
     * Arbitrary-length float input, buffered into whole frames.
     * @return index of the last keyword detected, or -1
     */
    int processFloat(const float* samples, size_t count);

    void setCallback(WakeWordCallback callback);

    static std::string getVersion();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sui::wakeword
