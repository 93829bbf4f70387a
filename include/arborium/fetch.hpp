#ifndef ARBORIUM_FETCH_HPP
#define ARBORIUM_FETCH_HPP

#include <filesystem>
#include <memory_resource>
#include <vector>

#include "arborium/util/io.hpp"
#include "arborium/util/result.hpp"

#include "arborium/fwd.hpp"
#include "arborium/services.hpp"

namespace arborium {

/// @brief Reads module artifacts from files.
/// The `module_path` of a catalog entry is resolved relative to a base directory,
/// unless it is absolute.
struct Directory_Module_Fetcher final : Module_Fetcher {
private:
    std::filesystem::path m_base;

public:
    [[nodiscard]]
    explicit Directory_Module_Fetcher(std::filesystem::path&& base);

    [[nodiscard]]
    const std::filesystem::path& get_base() const noexcept
    {
        return m_base;
    }

    [[nodiscard]]
    std::filesystem::path resolve(const Catalog_Entry& entry) const;

    [[nodiscard]]
    Result<void, IO_Error_Code>
    fetch(std::pmr::vector<unsigned char>& out, const Catalog_Entry& entry) final;
};

} // namespace arborium

#endif
