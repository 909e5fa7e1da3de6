/**
 * @file Sample.hpp
 * @brief One timestamped multi-channel reading.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_BUFFER_SAMPLE_HPP
    #define ERP_BUFFER_SAMPLE_HPP

    #include "erp/core/Types.hpp"

    #include <vector>

namespace erp::buffer {

/**
 * @brief A single multi-channel sample.
 *
 * @c timestamp is expressed on the clock of whoever produced the sample:
 * the source clock at the transport boundary, the local reference clock once
 * it has been stored in a SampleRingBuffer.
 */
struct Sample {
    core::Seconds timestamp = 0.0;
    std::vector<core::f32> values;
};

} // namespace erp::buffer

#endif // ERP_BUFFER_SAMPLE_HPP
