#include "fakes.h"
#include <cstring>

namespace Birch {

auto Interceptors::fail_after(int n) -> Interceptor
{
    return [n]() mutable {
        if (n-- <= 0)
            return special_error();
        return Status::ok();
    };
}

auto special_error() -> Status
{
    return Status::system_error("42");
}

auto is_special_error(const Status &s) -> bool
{
    return s.is_system_error() && s.what().to_string() == "42";
}

FaultyStore::FaultyStore(Size page_size)
    : m_base {page_size}
{}

auto FaultyStore::set_allocate_interceptor(Interceptor interceptor) -> void
{
    m_allocate_interceptor = std::move(interceptor);
}

auto FaultyStore::set_read_interceptor(Interceptor interceptor) -> void
{
    m_read_interceptor = std::move(interceptor);
}

auto FaultyStore::clear_interceptors() -> void
{
    m_allocate_interceptor = nullptr;
    m_read_interceptor = nullptr;
}

auto FaultyStore::corrupt_page(PageNumber id, Size offset) -> void
{
    m_corrupted[id.value] = offset;
}

auto FaultyStore::clear_corruption() -> void
{
    m_corrupted.clear();
}

auto FaultyStore::page_size() const -> Size
{
    return m_base.page_size();
}

auto FaultyStore::allocate_page(PageMut &out) -> Status
{
    if (m_allocate_interceptor) {
        if (auto s = m_allocate_interceptor(); !s.is_ok())
            return s;
    }
    return m_base.allocate_page(out);
}

auto FaultyStore::read_page(PageNumber id, PageHint hint, PageRef &out) -> Status
{
    m_read_count++;
    if (m_read_interceptor) {
        if (auto s = m_read_interceptor(); !s.is_ok())
            return s;
    }
    if (auto s = m_base.read_page(id, hint, out); !s.is_ok())
        return s;

    if (const auto itr = m_corrupted.find(id.value); itr != end(m_corrupted)) {
        auto copy = std::make_shared<Page>(id, out->size());
        auto span = copy->span();
        std::memcpy(span.data(), out->data().data(), out->size());
        span[itr->second] = static_cast<Byte>(~span[itr->second]);
        out = std::move(copy);
    }
    return Status::ok();
}

auto FaultyStore::write_page(PageNumber id, PageMut &out) -> Status
{
    return m_base.write_page(id, out);
}

auto FaultyStore::is_uncommitted(PageNumber id) const -> bool
{
    return m_base.is_uncommitted(id);
}

auto FaultyStore::free_page(PageNumber id) -> void
{
    m_base.free_page(id);
}

auto FaultyStore::mark_freed(PageNumber id) -> void
{
    m_base.mark_freed(id);
}

auto FaultyStore::commit(Size &version) -> Status
{
    return m_base.commit(version);
}

auto FaultyStore::rollback() -> void
{
    m_base.rollback();
}

auto FaultyStore::reclaim(Size oldest_live_version) -> Size
{
    return m_base.reclaim(oldest_live_version);
}

auto FaultyStore::live_page_count() const -> Size
{
    return m_base.live_page_count();
}

auto FaultyStore::version() const -> Size
{
    return m_base.version();
}

} // namespace Birch
