/**
 * WakeWordDetector.cpp - Porcupine wake word detection
 */

#include "sui/wakeword/WakeWordDetector.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <vector>

// Porcupine C API
extern "C" {
#include "pv_porcupine.h"
}

namespace sui::wakeword {

struct WakeWordDetector::Impl {
    pv_porcupine_t* porcupine = nullptr;
    WakeWordCallback callback;
    int frame_length = 512;
    bool ready = false;
    std::string last_error;
    std::vector<int16_t> accumulator;
    std::mutex mutex;

    explicit Impl(const WakeWordConfig& config) {
        if (config.keyword_paths.empty()) {
            last_error = "no keyword paths provided";
            std::cerr << "[WakeWord] " << last_error << std::endl;
            return;
        }

        std::vector<const char*> kw_paths;
        for (const auto& p : config.keyword_paths) {
            kw_paths.push_back(p.c_str());
        }

        std::vector<float> sens = config.sensitivities;
        sens.resize(config.keyword_paths.size(), 0.5f);

        pv_status_t status = pv_porcupine_init(
            config.access_key.c_str(),
            config.model_path.c_str(),
            "cpu",
            static_cast<int32_t>(kw_paths.size()),
            kw_paths.data(),
            sens.data(),
            &porcupine
        );

        if (status != PV_STATUS_SUCCESS) {
            last_error = std::string("Porcupine init failed: ") + pv_status_to_string(status);
            std::cerr << "[WakeWord] " << last_error << std::endl;
            porcupine = nullptr;
            return;
        }

        frame_length = pv_porcupine_frame_length();
        accumulator.reserve(static_cast<size_t>(frame_length) * 2);
        ready = true;

        std::cout << "[WakeWord] Porcupine initialized (version: "
                  << pv_porcupine_version()
                  << ", frame_length: " << frame_length << ")" << std::endl;
    }

    ~Impl() {
        if (porcupine) {
            pv_porcupine_delete(porcupine);
        }
    }

    int process(const int16_t* samples) {
        if (!ready) return -1;

        int32_t keyword_index = -1;
        pv_status_t status = pv_porcupine_process(porcupine, samples, &keyword_index);
        if (status != PV_STATUS_SUCCESS) {
            std::cerr << "[WakeWord] Process error: " << pv_status_to_string(status) << std::endl;
            return -1;
        }

        if (keyword_index >= 0) {
            std::cout << "[WakeWord] Keyword " << keyword_index << " detected" << std::endl;
            if (callback) callback(keyword_index);
        }
        return keyword_index;
    }

    int processFloat(const float* samples, size_t count) {
        if (!ready) return -1;
        std::lock_guard<std::mutex> lock(mutex);

        for (size_t i = 0; i < count; ++i) {
            float sample = std::clamp(samples[i], -1.0f, 1.0f);
            accumulator.push_back(static_cast<int16_t>(sample * 32767.0f));
        }

        int result = -1;
        size_t offset = 0;
        const size_t frame = static_cast<size_t>(frame_length);
        while (accumulator.size() - offset >= frame) {
            int idx = process(accumulator.data() + offset);
            if (idx >= 0) result = idx;
            offset += frame;
        }
        accumulator.erase(accumulator.begin(), accumulator.begin() + static_cast<std::ptrdiff_t>(offset));
        return result;
    }
};

WakeWordDetector::WakeWordDetector(const WakeWordConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

WakeWordDetector::~WakeWordDetector() = default;

bool WakeWordDetector::isReady() const {
    return impl_->ready;
}

const std::string& WakeWordDetector::lastError() const {
    return impl_->last_error;
}

int WakeWordDetector::getFrameLength() const {
    return impl_->frame_length;
}

int WakeWordDetector::getSampleRate() const {
    return pv_sample_rate();
}

int WakeWordDetector::process(const int16_t* samples) {
    return impl_->process(samples);
}

int WakeWordDetector::processFloat(const float* samples, size_t count) {
    return impl_->processFloat(samples, count);
}

void WakeWordDetector::setCallback(WakeWordCallback callback) {
    impl_->callback = std::move(callback);
}

std::string WakeWordDetector::getVersion() {
    return pv_porcupine_version();
}

} // namespace sui::wakeword
