#include "psh_service.hpp"
#include "share/share_state.hpp"

namespace pinshare::detail
{

Status share_region(SharePrimitive &kernel, const ShareInfo &info, std::span<const std::byte> region)
{
    // The kernel receives a writable pointer for ReadWrite slots; the storage
    // behind `region` is owned by a non-const buffer in that case.
    void *addr = const_cast<std::byte *>(region.data());
    auto res = kernel.share(info.id, addr, region.size(), info.mode);
    if (res.is_error())
    {
        const auto code = kernel_code(res);
        LOGGER_DEBUG("share {} {} ({} bytes) rejected by kernel: {} ({})", to_string(info.mode),
                     info.id, region.size(), to_string(code), static_cast<uint32_t>(code));
        return make_kernel_error(code);
    }
    LOGGER_TRACE("shared {} {} ({} bytes at {})", to_string(info.mode), info.id, region.size(),
                 fmt::ptr(region.data()));
    return ok_status();
}

void unshare_region(SharePrimitive &kernel, const ShareInfo &info) noexcept
{
    kernel.unshare(info.id, info.mode);
    LOGGER_TRACE("unshared {} {}", to_string(info.mode), info.id);
}

} // namespace pinshare::detail
