#pragma once
/**
 * @file status.hpp
 * @brief Per-resource outcome of a build pass and the sink it is written to.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include "trellis/source/resources.hpp"

namespace trellis::dag {

enum class StatusKind : std::uint8_t { Valid, Invalid, Orphaned };

std::string_view to_string(StatusKind k) noexcept;

/** @struct Status
 *  @brief Status record for one routing resource.
 */
struct Status {
    source::ResourceId id;
    StatusKind  kind{StatusKind::Valid};
    std::string description;
    std::string vhost;  ///< FQDN of the root whose traversal produced this record, if any

    bool operator==(const Status&) const = default;
};

/** @class StatusWriter
 *  @brief Destination for status records (the watch layer writes them back).
 */
class StatusWriter {
public:
    virtual ~StatusWriter() = default;
    virtual void set_status(const Status& s) = 0;
};

} // namespace trellis::dag
