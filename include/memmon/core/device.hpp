#pragma once
#include <optional>
#include <utility>
#include <string>

namespace memmon {

    /**
     * @brief Identifies one accelerator: a family tag ("cuda", "hpu", ...)
     * and an optional ordinal. An absent index means "the current device".
     */
    struct DeviceRef {
        std::string type;
        std::optional<int> index;

        DeviceRef() = default;
        explicit DeviceRef(std::string type, std::optional<int> index = std::nullopt)
            : type(std::move(type)), index(index) {}

        /**
         * @brief Parses "type" or "type:index".
         * @throws std::invalid_argument on an empty type or a malformed index.
         */
        static DeviceRef parse(const std::string& text);

        [[nodiscard]] std::string toString() const;

        bool operator==(const DeviceRef& other) const {
            return type == other.type && index == other.index;
        }
        bool operator!=(const DeviceRef& other) const { return !(*this == other); }
    };

} // namespace memmon
