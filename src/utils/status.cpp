#include "birch/status.h"
#include <cstring>

namespace Birch {

static auto maybe_copy_data(const Byte *data) -> std::unique_ptr<Byte[]>
{
    // Status is OK, so there isn't anything to copy.
    if (data == nullptr)
        return nullptr;

    // The first byte is the code, followed by a null-terminated message.
    const auto total_size = sizeof(Byte) + std::char_traits<Byte>::length(data + 1) + sizeof(Byte);
    auto copy = std::make_unique<Byte[]>(total_size);
    std::memcpy(copy.get(), data, total_size - sizeof(Byte));
    return copy;
}

Status::Status(Code code, const Slice &what)
    : m_data {std::make_unique<Byte[]>(what.size() + 2 * sizeof(Byte))}
{
    auto *ptr = m_data.get();

    // The first byte holds the status type.
    *ptr++ = static_cast<Byte>(code);

    // The rest holds the message, plus a '\0'. std::make_unique<Byte[]>() value-initializes, so the
    // last byte is already zero.
    std::memcpy(ptr, what.data(), what.size());
}

Status::Status(const Status &rhs)
    : m_data {maybe_copy_data(rhs.m_data.get())}
{}

Status::Status(Status &&rhs) noexcept
    : m_data {std::move(rhs.m_data)}
{}

auto Status::operator=(const Status &rhs) -> Status &
{
    if (this != &rhs)
        m_data = maybe_copy_data(rhs.m_data.get());
    return *this;
}

auto Status::operator=(Status &&rhs) noexcept -> Status &
{
    if (this != &rhs)
        m_data = std::move(rhs.m_data);
    return *this;
}

auto Status::ok() -> Status
{
    return Status {};
}

auto Status::invalid_argument(const Slice &what) -> Status
{
    return Status {Code::INVALID_ARGUMENT, what};
}

auto Status::system_error(const Slice &what) -> Status
{
    return Status {Code::SYSTEM_ERROR, what};
}

auto Status::logic_error(const Slice &what) -> Status
{
    return Status {Code::LOGIC_ERROR, what};
}

auto Status::corruption(const Slice &what) -> Status
{
    return Status {Code::CORRUPTION, what};
}

auto Status::not_found(const Slice &what) -> Status
{
    return Status {Code::NOT_FOUND, what};
}

auto Status::table_already_open(const Slice &what) -> Status
{
    return Status {Code::TABLE_ALREADY_OPEN, what};
}

auto Status::type_mismatch(const Slice &what) -> Status
{
    return Status {Code::TYPE_MISMATCH, what};
}

auto Status::code() const -> Code
{
    return static_cast<Code>(m_data[0]);
}

auto Status::is_ok() const -> bool
{
    return m_data == nullptr;
}

auto Status::is_invalid_argument() const -> bool
{
    return !is_ok() && code() == Code::INVALID_ARGUMENT;
}

auto Status::is_system_error() const -> bool
{
    return !is_ok() && code() == Code::SYSTEM_ERROR;
}

auto Status::is_logic_error() const -> bool
{
    return !is_ok() && code() == Code::LOGIC_ERROR;
}

auto Status::is_corruption() const -> bool
{
    return !is_ok() && code() == Code::CORRUPTION;
}

auto Status::is_not_found() const -> bool
{
    return !is_ok() && code() == Code::NOT_FOUND;
}

auto Status::is_table_already_open() const -> bool
{
    return !is_ok() && code() == Code::TABLE_ALREADY_OPEN;
}

auto Status::is_type_mismatch() const -> bool
{
    return !is_ok() && code() == Code::TYPE_MISMATCH;
}

auto Status::what() const -> Slice
{
    return m_data ? Slice {m_data.get() + sizeof(Code)} : Slice {"ok"};
}

} // namespace Birch
