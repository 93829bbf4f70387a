#include <filesystem>
#include <memory_resource>
#include <string>
#include <utility>
#include <vector>

#include "arborium/util/io.hpp"
#include "arborium/util/result.hpp"

#include "arborium/fetch.hpp"
#include "arborium/services.hpp"

namespace arborium {

Directory_Module_Fetcher::Directory_Module_Fetcher(std::filesystem::path&& base)
    : m_base { std::move(base) }
{
}

std::filesystem::path Directory_Module_Fetcher::resolve(const Catalog_Entry& entry) const
{
    const std::filesystem::path relative { entry.module_path,
                                           std::filesystem::path::generic_format };
    return m_base / relative;
}

Result<void, IO_Error_Code>
Directory_Module_Fetcher::fetch(std::pmr::vector<unsigned char>& out, const Catalog_Entry& entry)
{
    const std::u8string path = resolve(entry).generic_u8string();
    return file_to_bytes(out, path);
}

} // namespace arborium
