#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade for rebuild passes: pass events + counters.
 * @details The default implementation writes one structured line per pass to the
 *          process logger.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace trellis::obs {

    /** @struct Counters
     *  @brief Cumulative counters across rebuild passes.
     */
    struct Counters {
        uint64_t passes{0};             ///< Completed rebuild passes
        uint64_t invalid_resources{0};  ///< Sum of Invalid statuses over all passes
        uint64_t orphaned_resources{0}; ///< Sum of Orphaned statuses over all passes
    };

    /** @struct BuildEvent
     *  @brief Summary of a single rebuild pass.
     */
    struct BuildEvent {
        uint64_t    store_version{0};     ///< Store version the pass was built from
        std::size_t virtual_hosts{0};     ///< Insecure virtual hosts in the graph
        std::size_t secure_hosts{0};      ///< Secure virtual hosts in the graph
        std::size_t valid{0};             ///< Resources with Valid status
        std::size_t invalid{0};           ///< Resources with Invalid status
        std::size_t orphaned{0};          ///< Resources with Orphaned status
        std::size_t listeners{0};         ///< Projected listeners
        std::size_t route_configs{0};     ///< Projected route configurations
        std::size_t clusters{0};          ///< Projected clusters
        std::size_t secrets{0};           ///< Projected secrets
        std::chrono::microseconds elapsed{0};
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single pass.
        virtual void record(const BuildEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Observer that logs each pass through the process logger.
    std::unique_ptr<Observer> make_log_observer();

} // namespace trellis::obs
