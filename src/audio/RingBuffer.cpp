/**
 * RingBuffer.cpp - Explicit instantiations of the SPSC ring buffer
 * Note: all logic lives in the header (template class)
 */

#include "sui/audio/RingBuffer.hpp"

namespace sui::audio {

template class RingBuffer<float>;
template class RingBuffer<int16_t>;

} // namespace sui::audio
