/**
 * @file TimeCorrection.hpp
 * @brief Source/local clock correspondence handed from an inlet to the pipeline.
 *
 * Inlets measure correspondences on their own thread and queue them; the
 * thread that ingests samples applies them, so deferred samples released by
 * a new correspondence are appended by the buffer's only writer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ERP_TRANSPORT_TIME_CORRECTION_HPP
    #define ERP_TRANSPORT_TIME_CORRECTION_HPP

    #include "erp/core/Types.hpp"

namespace erp::transport {

/**
 * @brief One source/local clock correspondence obtained from time_correction().
 */
struct TimeCorrection {
    core::SourceId source = 0;
    core::Seconds sourceTime = 0.0;
    core::Seconds localTime = 0.0;
};

} // namespace erp::transport

#endif // ERP_TRANSPORT_TIME_CORRECTION_HPP
