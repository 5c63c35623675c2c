/**
 * Recognizer.hpp - Speech recognition collaborator interface
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sui::stt {

struct TranscriptionResult {
    std::string text;
    float confidence = 0.0f;
    bool is_final = false;
};

class Recognizer {
public:
    virtual ~Recognizer() = default;

    /**
     * Transcribe mono float PCM at the pipeline sample rate.
     * May be called concurrently (one partial and one final at a time).
     *
     * @param samples          Audio to transcribe
     * @param request_alignment Final pass: slower, more accurate decoding
     * @return nullopt on failure; an empty text means nothing was recognized
     */
    virtual std::optional<TranscriptionResult> recognize(const std::vector<float>& samples,
                                                         bool request_alignment) = 0;
};

} // namespace sui::stt
