#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace umadb::dcb {

// -----------------------------------------------------------------------------
// Uuid
// -----------------------------------------------------------------------------
//
// 128-bit identifier attached to an event for idempotent appends.
//
// Accepted text forms (hex digits in either case):
//   67e55044-10b1-426f-9247-bb680e5fe0c8          hyphenated
//   67e5504410b1426f9247bb680e5fe0c8              simple
//   {67e55044-10b1-426f-9247-bb680e5fe0c8}        braced
//   urn:uuid:67e55044-10b1-426f-9247-bb680e5fe0c8 urn
//
// to_string() always renders the lowercase hyphenated form.
// -----------------------------------------------------------------------------
class Uuid {
public:
    using bytes_type = std::array<std::uint8_t, 16>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(const bytes_type& bytes) noexcept : bytes_(bytes) {}

    // Parses `text` into `out`. On failure returns false and leaves `out`
    // untouched.
    [[nodiscard]]
    static bool parse(std::string_view text, Uuid& out) noexcept;

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr const bytes_type& bytes() const noexcept { return bytes_; }

    [[nodiscard]] bool is_nil() const noexcept;

    friend bool operator==(const Uuid&, const Uuid&) = default;
    friend auto operator<=>(const Uuid&, const Uuid&) = default;

private:
    bytes_type bytes_;
};

std::ostream& operator<<(std::ostream&, const Uuid&);

} // namespace umadb::dcb
