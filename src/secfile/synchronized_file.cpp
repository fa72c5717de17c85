#include <secfile/synchronized_file.hpp>

namespace secfile
{
synchronized_file::synchronized_file(encrypted_file file) noexcept
    : mSync{}
    , mFile{std::move(file)}
{
}

auto synchronized_file::change_passphrase(ro_dynblob newPassphrase) noexcept
        -> result<void>
{
    std::lock_guard lock{mSync};
    return mFile.change_passphrase(newPassphrase);
}

auto synchronized_file::stat() noexcept -> result<file_stat>
{
    std::lock_guard lock{mSync};
    return mFile.stat();
}

auto synchronized_file::sync() noexcept -> result<void>
{
    std::lock_guard lock{mSync};
    return mFile.sync();
}

auto synchronized_file::close() noexcept -> result<void>
{
    std::lock_guard lock{mSync};
    return mFile.close();
}

auto synchronized_file::read_sector(std::uint64_t index,
                                    rw_dynblob out) noexcept -> result<void>
{
    std::lock_guard lock{mSync};
    return mFile.read_sector(index, out);
}

auto synchronized_file::read_sector(std::uint64_t index) noexcept
        -> result<std::vector<std::byte>>
{
    std::lock_guard lock{mSync};
    return mFile.read_sector(index);
}

auto synchronized_file::write_sector(std::uint64_t index,
                                     ro_dynblob data) noexcept -> result<void>
{
    std::lock_guard lock{mSync};
    return mFile.write_sector(index, data);
}

auto synchronized_file::write_sector_sync(std::uint64_t index,
                                          ro_dynblob data) noexcept
        -> result<void>
{
    std::lock_guard lock{mSync};
    return mFile.write_sector_sync(index, data);
}

auto synchronized_file::write_sector_padded(std::uint64_t index,
                                            ro_dynblob data) noexcept
        -> result<void>
{
    std::lock_guard lock{mSync};
    return mFile.write_sector_padded(index, data);
}

auto synchronized_file::pad_sector(ro_dynblob data) const
        -> std::vector<std::byte>
{
    std::lock_guard lock{mSync};
    return mFile.pad_sector(data);
}

auto synchronized_file::zero_sector(std::uint64_t index) noexcept
        -> result<void>
{
    std::lock_guard lock{mSync};
    return mFile.zero_sector(index);
}

auto synchronized_file::count_sectors() noexcept -> result<std::uint64_t>
{
    std::lock_guard lock{mSync};
    return mFile.count_sectors();
}

auto synchronized_file::erase() noexcept -> result<void>
{
    std::lock_guard lock{mSync};
    return mFile.erase();
}

auto synchronized_file::seek(std::int64_t offset) -> result<std::int64_t>
{
    std::lock_guard lock{mSync};
    return mFile.seek(offset);
}

auto synchronized_file::read_at(rw_dynblob buffer, std::int64_t offset)
        -> transfer_result
{
    std::lock_guard lock{mSync};
    return mFile.read_at(buffer, offset);
}

auto synchronized_file::write_at(ro_dynblob buffer, std::int64_t offset)
        -> transfer_result
{
    std::lock_guard lock{mSync};
    return mFile.write_at(buffer, offset);
}

auto synchronized_file::read(rw_dynblob buffer) -> transfer_result
{
    std::lock_guard lock{mSync};
    return mFile.read(buffer);
}

auto synchronized_file::write(ro_dynblob buffer) -> transfer_result
{
    std::lock_guard lock{mSync};
    return mFile.write(buffer);
}
} // namespace secfile
