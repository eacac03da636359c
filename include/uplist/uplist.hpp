/*
 * uplist
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

// ReSharper disable CppClangTidyCppcoreguidelinesAvoidConstOrRefDataMembers
// ReSharper disable CppClangTidyBugproneMultiLevelImplicitPointerConversion

#ifndef UPLIST_HPP
#define UPLIST_HPP

#pragma once
#include <algorithm>
#include <array>
#include <bit>
#include <cassert>
#include <charconv>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <limits>
#include <memory>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include <cstdlib>
#if defined(_MSC_VER)
    #include <malloc.h>
#endif

#include <spdlog/spdlog.h>

#ifdef _MSC_VER
    #define UPLIST_FORCEINLINE __forceinline
#else
    #define UPLIST_FORCEINLINE __attribute__((always_inline)) inline
#endif

namespace uplist {
    class Arena;
    class ValueRef;

    // absolute time, UTC
    using Date = std::chrono::sys_time<std::chrono::nanoseconds>;

    using Bytes = std::vector<std::uint8_t>;

    struct Uid {
        std::uint64_t value {};

        friend constexpr bool operator==(const Uid&, const Uid&) noexcept = default;
    };
} // namespace uplist

namespace uplist::detail {

    template <class T>
    [[nodiscard]] std::string_view cpp_type_name() noexcept {
#if defined(__clang__) || defined(__GNUC__)
        const std::string_view fn = __PRETTY_FUNCTION__;
        constexpr std::string_view kPrefix = "T = ";
#elif defined(_MSC_VER)
        const std::string_view fn = __FUNCSIG__;
        constexpr std::string_view kPrefix = "cpp_type_name<";
#else
        return "unknown";
#endif

#if defined(__clang__) || defined(__GNUC__) || defined(_MSC_VER)
        const auto start = fn.find(kPrefix);
        if (start == std::string_view::npos)
            return fn;

        const auto first = start + kPrefix.size();

    #if defined(__clang__)
        const auto last = fn.rfind(']');
    #elif defined(__GNUC__)
        // "[with T = int; std::string_view = ...]"
        auto last = fn.find(';', first);
        if (last == std::string_view::npos)
            last = fn.rfind(']');
    #else
        const auto last = fn.rfind(">(void)");
    #endif

        if (last == std::string_view::npos || last <= first)
            return fn.substr(first);
        return fn.substr(first, last - first);
#endif
    }

    [[nodiscard]] UPLIST_FORCEINLINE constexpr bool is_digit(const char c) noexcept {
        return c >= '0' && c <= '9';
    }

    [[nodiscard]] inline bool parse_i64(std::string_view s, std::int64_t& out) noexcept {
        if (!s.empty() && s.front() == '+') {
            s.remove_prefix(1);
            if (!s.empty() && s.front() == '-')
                return false;
        }
        if (s.empty())
            return false;

        const char* last = s.data() + s.size();
        const auto [p, ec] = std::from_chars(s.data(), last, out, 10);
        return ec == std::errc {} && p == last;
    }

    [[nodiscard]] inline bool parse_u64(const std::string_view s, std::uint64_t& out) noexcept {
        // from_chars rejects both signs for unsigned targets
        if (s.empty())
            return false;

        const char* last = s.data() + s.size();
        const auto [p, ec] = std::from_chars(s.data(), last, out, 10);
        return ec == std::errc {} && p == last;
    }

    [[nodiscard]] inline bool parse_f64(std::string_view s, double& out) noexcept {
        if (!s.empty() && s.front() == '+') {
            s.remove_prefix(1);
            if (!s.empty() && s.front() == '-')
                return false;
        }
        if (s.empty())
            return false;

        const char* last = s.data() + s.size();
        const auto [p, ec] = std::from_chars(s.data(), last, out, std::chars_format::general);
        return ec == std::errc {} && p == last;
    }

    [[nodiscard]] inline bool parse_bool(const std::string_view s, bool& out) noexcept {
        if (s == "1" || s == "t" || s == "T" || s == "TRUE" || s == "true" || s == "True") {
            out = true;
            return true;
        }
        if (s == "0" || s == "f" || s == "F" || s == "FALSE" || s == "false" || s == "False") {
            out = false;
            return true;
        }
        return false;
    }

    [[nodiscard]] inline bool parse_fixed_digits(const std::string_view s, const std::size_t pos, const std::size_t n, int& out) noexcept {
        if (pos + n > s.size())
            return false;

        int v = 0;
        for (std::size_t i = 0; i < n; ++i) {
            const char c = s[pos + i];
            if (!is_digit(c))
                return false;
            v = v * 10 + (c - '0');
        }
        out = v;
        return true;
    }

    // text property-list layout: "2006-01-02 15:04:05 -0700", with up to nine
    // fractional second digits allowed after the seconds
    [[nodiscard]] inline bool parse_text_date(const std::string_view s, Date& out) noexcept {
        constexpr std::size_t kSecondsEnd = 19;
        constexpr std::size_t kZoneSize = 6;
        if (s.size() < kSecondsEnd + kZoneSize)
            return false;

        int year {}, mon {}, mday {}, hour {}, min {}, sec {}, off_h {}, off_m {};

        if (!parse_fixed_digits(s, 0, 4, year) || s[4] != '-')
            return false;
        if (!parse_fixed_digits(s, 5, 2, mon) || s[7] != '-')
            return false;
        if (!parse_fixed_digits(s, 8, 2, mday) || s[10] != ' ')
            return false;
        if (!parse_fixed_digits(s, 11, 2, hour) || s[13] != ':')
            return false;
        if (!parse_fixed_digits(s, 14, 2, min) || s[16] != ':')
            return false;
        if (!parse_fixed_digits(s, 17, 2, sec))
            return false;

        std::size_t pos = kSecondsEnd;
        std::int64_t frac_ns = 0;
        if (s[pos] == '.') {
            ++pos;
            std::int64_t scale = 100'000'000;
            const std::size_t first = pos;
            while (pos < s.size() && is_digit(s[pos])) {
                if (pos - first == 9)
                    return false;
                frac_ns += (s[pos] - '0') * scale;
                scale /= 10;
                ++pos;
            }
            if (pos == first)
                return false;
        }

        if (s.size() != pos + kZoneSize || s[pos] != ' ')
            return false;

        const char sign = s[pos + 1];
        if (sign != '+' && sign != '-')
            return false;
        if (!parse_fixed_digits(s, pos + 2, 2, off_h) || !parse_fixed_digits(s, pos + 4, 2, off_m))
            return false;

        if (hour > 23 || min > 59 || sec > 59 || off_h > 23 || off_m > 59)
            return false;

        const std::chrono::year_month_day ymd {std::chrono::year {year}, std::chrono::month {static_cast<unsigned>(mon)}, std::chrono::day {static_cast<unsigned>(mday)}};
        if (!ymd.ok())
            return false;

        Date tp = std::chrono::sys_days {ymd} + std::chrono::hours {hour} + std::chrono::minutes {min} + std::chrono::seconds {sec} + std::chrono::nanoseconds {frac_ns};

        const auto offset = std::chrono::hours {off_h} + std::chrono::minutes {off_m};
        if (sign == '+')
            tp -= offset;
        else
            tp += offset;

        out = tp;
        return true;
    }

    // 0 -> 4, doubling below 1024, +25% above
    [[nodiscard]] constexpr std::size_t grow_capacity(const std::size_t cap) noexcept {
        if (cap == 0)
            return 4;
        if (cap < 1024)
            return cap * 2;
        return cap + cap / 4;
    }

    template <class T, template <class...> class Tmpl>
    struct is_specialization_of : std::false_type { };

    template <template <class...> class Tmpl, class... Args>
    struct is_specialization_of<Tmpl<Args...>, Tmpl> : std::true_type { };

    template <class T>
    struct is_std_array : std::false_type { };

    template <class T, std::size_t N>
    struct is_std_array<std::array<T, N>> : std::true_type { };

    template <class T>
    void allocate(std::unique_ptr<T>& p) {
        p = std::make_unique<T>();
    }

    template <class T>
    void allocate(std::shared_ptr<T>& p) {
        p = std::make_shared<T>();
    }

    template <class T>
    void allocate(std::optional<T>& p) {
        p.emplace();
    }

} // namespace uplist::detail

namespace uplist {

    constexpr auto kDefaultBlockSize = 64ull * 1024ull;
    constexpr auto kDefaultMaxDepth = 512u;

    template <uint64_t BlockSize = kDefaultBlockSize>
    struct NewAllocator {
        static constexpr auto kBlockSize = BlockSize;

        void* allocate(std::size_t sz, std::size_t al) {
            if (al == 0 || !std::has_single_bit(al))
                return nullptr;

#if defined(_MSC_VER)
            return _aligned_malloc(sz, al);
#else
            void* p {};
            if (posix_memalign(&p, al, sz) != 0)
                return nullptr;
            return p;
#endif
        }

        // ReSharper disable once CppMemberFunctionMayBeStatic
        void deallocate(void* p, std::size_t, std::size_t) noexcept {
#if defined(_MSC_VER)
            _aligned_free(p);
#else
            std::free(p);
#endif
        }
    };

    template <uint64_t BlockSize = kDefaultBlockSize>
    struct PmrAllocator {
        static constexpr auto kBlockSize = BlockSize;

        std::pmr::memory_resource* resource {};

        PmrAllocator() = default;

        explicit PmrAllocator(std::pmr::memory_resource* r): resource(r) { }

        [[nodiscard]] void* allocate(const std::size_t sz, const std::size_t al) const {
            return resource ? resource->allocate(sz, al) : nullptr;
        }

        void deallocate(void* p, const std::size_t sz, const std::size_t al) const noexcept {
            if (resource)
                resource->deallocate(p, sz, al);
        }
    };

    template <class T>
    concept AllocatorLike = requires(T a, std::size_t sz, std::size_t align) {
        { T::kBlockSize } -> std::convertible_to<uint64_t>;
        { a.allocate(sz, align) } -> std::same_as<void*>;
        { a.deallocate(static_cast<void*>(nullptr), sz, align) } -> std::same_as<void>;
    };

    class Arena {
        struct Block {
            Block* next;
            std::size_t cap;
            std::size_t used;
        };

    public:
        template <AllocatorLike Alloc>
        explicit Arena(Alloc& alloc);

        ~Arena();

        Arena(const Arena&) = delete;
        Arena& operator=(const Arena&) = delete;

        Arena(Arena&&) = delete;
        Arena& operator=(Arena&&) = delete;

        void* alloc(std::size_t sz, std::size_t al = alignof(std::max_align_t));

        template <class T, class... Args>
        UPLIST_FORCEINLINE T* make(Args&&... args) noexcept;

        template <class T>
        UPLIST_FORCEINLINE T* make_array(std::size_t n);

        void reset();

    private:
        static constexpr bool valid_align(const std::size_t a) noexcept {
            return a != 0 && std::has_single_bit(a);
        }

        static char* payload(Block* b) noexcept;

        bool add_block(std::size_t min_payload);
        void release() noexcept;

        void* allocator_ {};
        void* (*alloc_fn_)(void*, std::size_t, std::size_t) {};
        void (*dealloc_fn_)(void*, void*, std::size_t, std::size_t) {};

        Block* head_ {};
        Block* cur_ {};
        std::size_t block_size_ {kDefaultBlockSize};
        std::size_t block_align_ {alignof(std::max_align_t)};
    };

    template <AllocatorLike Alloc>
    Arena::Arena(Alloc& alloc)
        : allocator_(&alloc), alloc_fn_([](void* self, std::size_t sz, std::size_t al) { return static_cast<Alloc*>(self)->allocate(sz, al); }),
          dealloc_fn_([](void* self, void* p, std::size_t sz, std::size_t al) { static_cast<Alloc*>(self)->deallocate(p, sz, al); }), block_size_(Alloc::kBlockSize) { }

    inline Arena::~Arena() {
        release();
    }

    inline void* Arena::alloc(const std::size_t sz, const std::size_t al) {
        if (!valid_align(al))
            return nullptr;

        if (sz > std::numeric_limits<std::size_t>::max() - al)
            return nullptr;

        if (!cur_ && !add_block(sz + al))
            return nullptr;

        for (;;) {
            const auto base = reinterpret_cast<std::uintptr_t>(payload(cur_));

            const auto mask = ~(static_cast<std::uintptr_t>(al) - 1u);
            const std::uintptr_t aligned = (base + cur_->used + (static_cast<std::uintptr_t>(al) - 1u)) & mask;

            if (const std::size_t off = aligned - base; off + sz <= cur_->cap) {
                const auto ptr = std::bit_cast<void*>(aligned);
                cur_->used = off + sz;
                return ptr;
            }

            if (!add_block(sz + al))
                return nullptr;
        }
    }

    template <class T, class... Args>
    UPLIST_FORCEINLINE T* Arena::make(Args&&... args) noexcept {
        void* mem = alloc(sizeof(T), alignof(T));
        if (!mem)
            return nullptr;

        T* ptr = static_cast<T*>(mem);

        static_assert(std::is_constructible_v<T, Args...>, "Type not constructible");
        return std::construct_at(ptr, std::forward<Args>(args)...);
    }

    template <class T>
    UPLIST_FORCEINLINE T* Arena::make_array(const std::size_t n) {
        return static_cast<T*>(alloc(sizeof(T) * n, alignof(T))); // NOLINT(bugprone-sizeof-expression)
    }

    inline void Arena::reset() {
        release();
        head_ = nullptr;
        cur_ = nullptr;
    }

    inline void Arena::release() noexcept {
        Block* b = head_;
        while (b) {
            Block* next = b->next;
            dealloc_fn_(allocator_, b, sizeof(Block) + b->cap, block_align_);
            b = next;
        }
    }

    inline char* Arena::payload(Block* b) noexcept {
        return reinterpret_cast<char*>(b + 1);
    }

    inline bool Arena::add_block(const std::size_t min_payload) {
        const std::size_t cap = std::max(block_size_, min_payload);
        const std::size_t total = sizeof(Block) + cap;

        block_align_ = std::max<std::size_t>(alignof(std::max_align_t), alignof(Block));
        void* mem = alloc_fn_(allocator_, total, block_align_);
        if (!mem)
            return false;

        auto* b = static_cast<Block*>(mem);
        b->next = nullptr;
        b->cap = cap;
        b->used = 0;

        if (!head_)
            head_ = b;
        else
            cur_->next = b;

        cur_ = b;
        return true;
    }

    class ArenaHolder {
    public:
        constexpr ArenaHolder() noexcept = default;

        explicit ArenaHolder(bool): own_alloc_ {NewAllocator {}}, own_arena_ {std::in_place, own_alloc_}, arena_ {&own_arena_.value()}, is_owner_ {true} {
            assert(arena_);
        }

        template <AllocatorLike Allocator>
        explicit ArenaHolder(Allocator& alloc): own_arena_ {std::in_place, alloc}, arena_ {&own_arena_.value()}, is_owner_ {true} {
            assert(arena_);
        }

        explicit ArenaHolder(Arena& arena) noexcept: arena_ {&arena} { }

        ~ArenaHolder() {
            reset();
        }

        ArenaHolder(const ArenaHolder&) = delete;
        ArenaHolder& operator=(const ArenaHolder&) = delete;

        // the owned arena points at own_alloc_, so a holder stays where it was built
        ArenaHolder(ArenaHolder&&) = delete;
        ArenaHolder& operator=(ArenaHolder&&) = delete;

        [[nodiscard]] Arena& arena() const noexcept {
            assert(arena_);
            return *arena_;
        }

        [[nodiscard]] explicit operator bool() const noexcept {
            return arena_ != nullptr;
        }

        void reset() noexcept {
            if (is_owner_) {
                own_arena_.reset();
                is_owner_ = false;
            }
            arena_ = nullptr;
        }

    protected:
        [[no_unique_address]] NewAllocator<> own_alloc_ {};
        std::optional<Arena> own_arena_ {};
        Arena* arena_ = nullptr;
        bool is_owner_ = false;
    };

    enum class Type : std::uint8_t {
        String,
        Number,
        Real,
        Boolean,
        Data,
        Date,
        Uid,
        Array,
        Dictionary
    };

    [[nodiscard]] constexpr std::string_view type_name(const Type t) noexcept {
        switch (t) {
        case Type::String:
            return "string";
        case Type::Number:
            return "integer";
        case Type::Real:
            return "real";
        case Type::Boolean:
            return "boolean";
        case Type::Data:
            return "data";
        case Type::Date:
            return "date";
        case Type::Uid:
            return "UID";
        case Type::Array:
            return "array";
        case Type::Dictionary:
            return "dictionary";
        }
        return "unknown";
    }

    struct Node {
        Type type {Type::String};
        std::string_view key {}; // used for dictionary entries

        union Data {
            bool b;

            struct {
                std::uint64_t value;
                bool is_signed;
            } num;

            struct {
                double value;
                bool wide; // 64-bit source encoding
            } real;

            std::string_view str;

            struct {
                const std::uint8_t* ptr;
                std::uint32_t size;
            } bytes;

            std::int64_t date; // nanoseconds since the Unix epoch
            std::uint64_t uid;

            struct {
                std::uint32_t count;
                std::uint32_t capacity;
                Node** items;
            } kids;

            Data() { }

        } data;

        static constexpr bool is_container(const Type t) noexcept {
            return t == Type::Array || t == Type::Dictionary;
        }
    };

    static_assert(std::is_trivially_copyable_v<Node>);
    static_assert(std::is_trivially_copyable_v<Node::Data>);

    class ValueRef {
    public:
        ValueRef() = default;
        explicit ValueRef(const Node* n) noexcept: n_(n) { }

        // precondition: !is_null()
        [[nodiscard]] UPLIST_FORCEINLINE Type type() const noexcept {
            assert(n_);
            return n_->type;
        }
        [[nodiscard]] UPLIST_FORCEINLINE const Node* raw() const noexcept {
            return n_;
        }

        [[nodiscard]] UPLIST_FORCEINLINE bool is_null() const noexcept {
            return !n_;
        }
        [[nodiscard]] UPLIST_FORCEINLINE bool is_string() const noexcept {
            return n_ && n_->type == Type::String;
        }
        [[nodiscard]] UPLIST_FORCEINLINE bool is_number() const noexcept {
            return n_ && n_->type == Type::Number;
        }
        [[nodiscard]] UPLIST_FORCEINLINE bool is_real() const noexcept {
            return n_ && n_->type == Type::Real;
        }
        [[nodiscard]] UPLIST_FORCEINLINE bool is_bool() const noexcept {
            return n_ && n_->type == Type::Boolean;
        }
        [[nodiscard]] UPLIST_FORCEINLINE bool is_data() const noexcept {
            return n_ && n_->type == Type::Data;
        }
        [[nodiscard]] UPLIST_FORCEINLINE bool is_date() const noexcept {
            return n_ && n_->type == Type::Date;
        }
        [[nodiscard]] UPLIST_FORCEINLINE bool is_uid() const noexcept {
            return n_ && n_->type == Type::Uid;
        }
        [[nodiscard]] UPLIST_FORCEINLINE bool is_array() const noexcept {
            return n_ && n_->type == Type::Array;
        }
        [[nodiscard]] UPLIST_FORCEINLINE bool is_dictionary() const noexcept {
            return n_ && n_->type == Type::Dictionary;
        }

        [[nodiscard]] UPLIST_FORCEINLINE bool is_signed() const noexcept {
            return is_number() && n_->data.num.is_signed;
        }
        [[nodiscard]] UPLIST_FORCEINLINE bool is_wide() const noexcept {
            return is_real() && n_->data.real.wide;
        }

        [[nodiscard]] UPLIST_FORCEINLINE std::optional<std::string_view> try_string() const noexcept {
            if (is_string())
                return n_->data.str;
            return std::nullopt;
        }
        [[nodiscard]] UPLIST_FORCEINLINE std::optional<bool> try_bool() const noexcept {
            if (is_bool())
                return n_->data.b;
            return std::nullopt;
        }
        [[nodiscard]] UPLIST_FORCEINLINE std::optional<std::int64_t> try_i64() const noexcept {
            if (is_number())
                return static_cast<std::int64_t>(n_->data.num.value);
            return std::nullopt;
        }
        [[nodiscard]] UPLIST_FORCEINLINE std::optional<std::uint64_t> try_u64() const noexcept {
            if (is_number())
                return n_->data.num.value;
            return std::nullopt;
        }
        [[nodiscard]] UPLIST_FORCEINLINE std::optional<double> try_double() const noexcept {
            if (is_real())
                return n_->data.real.value;
            return std::nullopt;
        }
        [[nodiscard]] UPLIST_FORCEINLINE std::optional<std::span<const std::uint8_t>> try_data() const noexcept {
            if (is_data())
                return std::span<const std::uint8_t> {n_->data.bytes.ptr, n_->data.bytes.size};
            return std::nullopt;
        }
        [[nodiscard]] UPLIST_FORCEINLINE std::optional<Date> try_date() const noexcept {
            if (is_date())
                return Date {std::chrono::nanoseconds {n_->data.date}};
            return std::nullopt;
        }
        [[nodiscard]] UPLIST_FORCEINLINE std::optional<Uid> try_uid() const noexcept {
            if (is_uid())
                return Uid {n_->data.uid};
            return std::nullopt;
        }

        [[nodiscard]] UPLIST_FORCEINLINE std::string_view as_string(const std::string_view def = {}) const noexcept {
            return is_string() ? n_->data.str : def;
        }

        [[nodiscard]] UPLIST_FORCEINLINE std::uint32_t size() const noexcept {
            return n_ && Node::is_container(n_->type) ? n_->data.kids.count : 0;
        }

        [[nodiscard]] UPLIST_FORCEINLINE ValueRef at(const std::uint32_t i) const noexcept {
            if (!is_array())
                return {};

            const auto& k = n_->data.kids;
            if (i >= k.count || !k.items)
                return {};
            return ValueRef {k.items[i]};
        }

        [[nodiscard]] UPLIST_FORCEINLINE ValueRef operator[](const std::uint32_t i) const noexcept {
            return at(i);
        }

        // duplicate keys: the last entry wins
        [[nodiscard]] ValueRef get(const std::string_view key) const noexcept {
            if (!is_dictionary())
                return {};

            const auto& k = n_->data.kids;
            for (std::uint32_t i = k.count; i > 0; --i) {
                if (const Node* cand = k.items[i - 1]; cand && cand->key == key)
                    return ValueRef {cand};
            }
            return {};
        }

        [[nodiscard]] UPLIST_FORCEINLINE ValueRef operator[](const std::string_view key) const noexcept {
            return get(key);
        }

        [[nodiscard]] UPLIST_FORCEINLINE bool contains(const std::string_view key) const noexcept {
            return !get(key).is_null();
        }

        template <class Fn>
            requires std::invocable<Fn, ValueRef>
        void for_each(Fn&& fn) const {
            if (!n_ || !Node::is_container(n_->type) || !n_->data.kids.items)
                return;

            const auto& k = n_->data.kids;
            for (std::uint32_t i = 0; i < k.count; ++i) {
                ValueRef v {k.items[i]};
                if constexpr (std::convertible_to<std::invoke_result_t<Fn, ValueRef>, bool>) {
                    if (!fn(v))
                        return;
                } else {
                    fn(v);
                }
            }
        }

        // ---- ranges ----
        struct ArrayIter;
        struct ArrayRange;

        [[nodiscard]] UPLIST_FORCEINLINE ArrayRange items() const noexcept;

        struct ObjIter;
        struct ObjRange;

        [[nodiscard]] UPLIST_FORCEINLINE ObjRange members() const noexcept;

    private:
        const Node* n_ {};
    };

    struct ValueRef::ArrayIter {
        Node* const* cur {};

        UPLIST_FORCEINLINE ValueRef operator*() const noexcept {
            return ValueRef {*cur};
        }

        UPLIST_FORCEINLINE ArrayIter& operator++() noexcept {
            ++cur;
            return *this;
        }

        [[nodiscard]] UPLIST_FORCEINLINE bool operator!=(const ArrayIter& o) const noexcept {
            return cur != o.cur;
        }
    };

    struct ValueRef::ArrayRange {
        Node* const* first {};
        std::uint32_t count {};

        [[nodiscard]] UPLIST_FORCEINLINE ArrayIter begin() const noexcept {
            return {first};
        }
        [[nodiscard]] UPLIST_FORCEINLINE ArrayIter end() const noexcept {
            return {first + count};
        }
    };

    struct ValueRef::ObjIter {
        struct Member {
            std::string_view key;
            ValueRef value;
        };

        Node* const* cur {};

        UPLIST_FORCEINLINE Member operator*() const noexcept {
            const Node* child = *cur;
            return child ? Member {.key = child->key, .value = ValueRef {child}} : Member {};
        }

        UPLIST_FORCEINLINE ObjIter& operator++() noexcept {
            ++cur;
            return *this;
        }

        [[nodiscard]] UPLIST_FORCEINLINE bool operator!=(const ObjIter& o) const noexcept {
            return cur != o.cur;
        }
    };

    struct ValueRef::ObjRange {
        Node* const* first {};
        std::uint32_t count {};

        [[nodiscard]] UPLIST_FORCEINLINE ObjIter begin() const noexcept {
            return {first};
        }
        [[nodiscard]] UPLIST_FORCEINLINE ObjIter end() const noexcept {
            return {first + count};
        }
    };

    UPLIST_FORCEINLINE ValueRef::ArrayRange ValueRef::items() const noexcept {
        if (!is_array() || !n_->data.kids.items)
            return {};
        return ArrayRange {.first = n_->data.kids.items, .count = n_->data.kids.count};
    }

    UPLIST_FORCEINLINE ValueRef::ObjRange ValueRef::members() const noexcept {
        if (!is_dictionary() || !n_->data.kids.items)
            return {};
        return ObjRange {.first = n_->data.kids.items, .count = n_->data.kids.count};
    }

    // ---- dynamic values ----

    struct Value;

    using ValueArray = std::vector<Value>;
    using ValueDictionary = std::unordered_map<std::string, Value>;
    using ValueBase = std::variant<std::monostate, std::string, std::int64_t, std::uint64_t, double, float, bool, Bytes, Date, Uid, ValueArray, ValueDictionary>;

    struct Value : ValueBase {
        using ValueBase::ValueBase;

        [[nodiscard]] bool is_null() const noexcept {
            return std::holds_alternative<std::monostate>(base());
        }

        template <class T>
        [[nodiscard]] bool is() const noexcept {
            return std::holds_alternative<T>(base());
        }

        template <class T>
        [[nodiscard]] const T& as() const {
            return std::get<T>(base());
        }

        template <class T>
        [[nodiscard]] T& as() {
            return std::get<T>(static_cast<ValueBase&>(*this));
        }

        template <class T>
        [[nodiscard]] const T* get_if() const noexcept {
            return std::get_if<T>(&base());
        }

        [[nodiscard]] const ValueBase& base() const noexcept {
            return *this;
        }
    };

    [[nodiscard]] inline bool operator==(const Value& a, const Value& b) {
        return a.base() == b.base();
    }

    // Total over every node kind; an absent node maps to std::monostate.
    [[nodiscard]] inline Value to_value(const ValueRef v) {
        const Node* n = v.raw();
        if (!n)
            return {};

        switch (n->type) {
        case Type::String:
            return Value {std::string {n->data.str}};
        case Type::Number:
            if (n->data.num.is_signed)
                return Value {static_cast<std::int64_t>(n->data.num.value)};
            return Value {n->data.num.value};
        case Type::Real:
            if (n->data.real.wide)
                return Value {n->data.real.value};
            return Value {static_cast<float>(n->data.real.value)};
        case Type::Boolean:
            return Value {n->data.b};
        case Type::Data:
            return Value {Bytes(n->data.bytes.ptr, n->data.bytes.ptr + n->data.bytes.size)};
        case Type::Date:
            return Value {Date {std::chrono::nanoseconds {n->data.date}}};
        case Type::Uid:
            return Value {Uid {n->data.uid}};
        case Type::Array: {
            ValueArray out;
            out.reserve(v.size());
            for (const ValueRef item : v.items())
                out.push_back(to_value(item));
            return Value {std::move(out)};
        }
        case Type::Dictionary: {
            ValueDictionary out;
            out.reserve(v.size());
            for (const auto [key, item] : v.members()) {
                if (!item.is_null())
                    out.insert_or_assign(std::string {key}, to_value(item));
            }
            return Value {std::move(out)};
        }
        }
        return {};
    }

    // ---- errors ----

    enum class ErrorCode : std::uint8_t {
        None,
        TypeMismatch,
        SizeExceeded,
        UnwritableField,
        KeyType,
        InvalidLiteral,
        UnsupportedMetadata,
        UnknownNodeType,
        DepthExceeded,
        Custom,
        Multiple,
        OutOfMemory,
        BuilderInvalidState,
    };

    [[nodiscard]] constexpr const char* error_code_name(const ErrorCode c) noexcept {
        switch (c) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::TypeMismatch:
            return "TypeMismatch";
        case ErrorCode::SizeExceeded:
            return "SizeExceeded";
        case ErrorCode::UnwritableField:
            return "UnwritableField";
        case ErrorCode::KeyType:
            return "KeyType";
        case ErrorCode::InvalidLiteral:
            return "InvalidLiteral";
        case ErrorCode::UnsupportedMetadata:
            return "UnsupportedMetadata";
        case ErrorCode::UnknownNodeType:
            return "UnknownNodeType";
        case ErrorCode::DepthExceeded:
            return "DepthExceeded";
        case ErrorCode::Custom:
            return "Custom";
        case ErrorCode::Multiple:
            return "Multiple";
        case ErrorCode::OutOfMemory:
            return "OutOfMemory";
        case ErrorCode::BuilderInvalidState:
            return "BuilderInvalidState";
        }
        return "Unknown";
    }

    struct Location {
        enum class Kind : std::uint8_t {
            Index,
            Field,
            Key
        };

        Kind kind {Kind::Index};
        std::size_t index {};
        std::string name {};

        [[nodiscard]] static Location at_index(const std::size_t i) {
            return Location {.kind = Kind::Index, .index = i, .name = {}};
        }

        [[nodiscard]] static Location at_field(const std::string_view field) {
            return Location {.kind = Kind::Field, .index = 0, .name = std::string {field}};
        }

        [[nodiscard]] static Location at_key(const std::string_view key) {
            return Location {.kind = Kind::Key, .index = 0, .name = std::string {key}};
        }

        [[nodiscard]] std::string to_string() const {
            std::string out;
            switch (kind) {
            case Kind::Index:
                out.append("element ");
                out.append(std::to_string(index));
                break;
            case Kind::Field:
                out.append("field \"");
                out.append(name);
                out.push_back('"');
                break;
            case Kind::Key:
                out.append("map key \"");
                out.append(name);
                out.push_back('"');
                break;
            }
            return out;
        }
    };

    struct ErrorCause;

    // A code of Multiple carries one cause per failed element, field or key.
    class DecodeError {
    public:
        DecodeError() = default;
        explicit DecodeError(ErrorCode code, std::string message = {});

        [[nodiscard]] static DecodeError type_mismatch(std::string_view dest, Type src);
        [[nodiscard]] static DecodeError size_exceeded(std::size_t count, std::size_t capacity, std::string_view unit, std::string_view target);
        [[nodiscard]] static DecodeError unwritable_field(std::string_view field);
        [[nodiscard]] static DecodeError key_type(std::string_view key_type);
        [[nodiscard]] static DecodeError invalid_literal(std::string_view text, std::string_view kind, std::string_view dest);
        [[nodiscard]] static DecodeError unsupported_metadata(std::string_view dest, std::string_view detail);
        [[nodiscard]] static DecodeError unknown_node(Type src);
        [[nodiscard]] static DecodeError depth_exceeded(std::uint32_t max_depth);
        [[nodiscard]] static DecodeError custom(std::string message);

        [[nodiscard]] UPLIST_FORCEINLINE ErrorCode code() const noexcept {
            return code_;
        }

        [[nodiscard]] UPLIST_FORCEINLINE bool ok() const noexcept {
            return code_ == ErrorCode::None;
        }

        [[nodiscard]] UPLIST_FORCEINLINE explicit operator bool() const noexcept {
            return ok();
        }

        [[nodiscard]] std::string_view dest_type() const noexcept {
            return dest_;
        }

        [[nodiscard]] std::string_view src_type() const noexcept {
            return src_;
        }

        [[nodiscard]] const std::vector<ErrorCause>& causes() const noexcept {
            return causes_;
        }

        [[nodiscard]] std::size_t size() const noexcept;

        void append(Location where, DecodeError err);

        [[nodiscard]] const DecodeError* find_index(std::size_t index) const noexcept;
        [[nodiscard]] const DecodeError* find_field(std::string_view field) const noexcept;
        [[nodiscard]] const DecodeError* find_key(std::string_view key) const noexcept;

        [[nodiscard]] std::string to_string() const;

    private:
        [[nodiscard]] const DecodeError* find(Location::Kind kind, std::size_t index, std::string_view name) const noexcept;

        ErrorCode code_ {ErrorCode::None};
        std::string dest_ {};
        std::string_view src_ {};
        std::string message_ {};
        std::vector<ErrorCause> causes_ {};
    };

    struct ErrorCause {
        Location where;
        DecodeError error;
    };

    inline DecodeError::DecodeError(const ErrorCode code, std::string message): code_(code), message_(std::move(message)) { }

    inline DecodeError DecodeError::type_mismatch(const std::string_view dest, const Type src) {
        DecodeError e {ErrorCode::TypeMismatch};
        e.dest_ = std::string {dest};
        e.src_ = type_name(src);
        return e;
    }

    inline DecodeError DecodeError::size_exceeded(const std::size_t count, const std::size_t capacity, const std::string_view unit, const std::string_view target) {
        std::string msg;
        msg.reserve(96);
        msg.append("uplist: attempted to unmarshal ");
        msg.append(std::to_string(count));
        msg.push_back(' ');
        msg.append(unit);
        msg.append(" into ");
        msg.append(target);
        msg.append(" of size ");
        msg.append(std::to_string(capacity));
        return DecodeError {ErrorCode::SizeExceeded, std::move(msg)};
    }

    inline DecodeError DecodeError::unwritable_field(const std::string_view field) {
        std::string msg = "field \"";
        msg.append(field);
        msg.append("\" not settable");
        return DecodeError {ErrorCode::UnwritableField, std::move(msg)};
    }

    inline DecodeError DecodeError::key_type(const std::string_view key_type) {
        DecodeError e {ErrorCode::KeyType};
        e.dest_ = std::string {key_type};
        e.src_ = type_name(Type::Dictionary);
        return e;
    }

    inline DecodeError DecodeError::invalid_literal(const std::string_view text, const std::string_view kind, const std::string_view dest) {
        std::string msg = "uplist: invalid ";
        msg.append(kind);
        msg.append(" literal `");
        msg.append(text);
        msg.append("'");

        DecodeError e {ErrorCode::InvalidLiteral, std::move(msg)};
        e.dest_ = std::string {dest};
        e.src_ = type_name(Type::String);
        return e;
    }

    inline DecodeError DecodeError::unsupported_metadata(const std::string_view dest, const std::string_view detail) {
        std::string msg = "uplist: unsupported field metadata for type `";
        msg.append(dest);
        msg.append("': ");
        msg.append(detail);

        DecodeError e {ErrorCode::UnsupportedMetadata, std::move(msg)};
        e.dest_ = std::string {dest};
        return e;
    }

    inline DecodeError DecodeError::unknown_node(const Type src) {
        DecodeError e {ErrorCode::UnknownNodeType, "uplist: unknown node type"};
        e.src_ = type_name(src);
        return e;
    }

    inline DecodeError DecodeError::depth_exceeded(const std::uint32_t max_depth) {
        return DecodeError {ErrorCode::DepthExceeded, "uplist: nesting deeper than " + std::to_string(max_depth) + " levels"};
    }

    inline DecodeError DecodeError::custom(std::string message) {
        return DecodeError {ErrorCode::Custom, std::move(message)};
    }

    inline std::size_t DecodeError::size() const noexcept {
        return causes_.size();
    }

    inline void DecodeError::append(Location where, DecodeError err) {
        assert(code_ == ErrorCode::None || code_ == ErrorCode::Multiple);
        code_ = ErrorCode::Multiple;
        causes_.push_back(ErrorCause {.where = std::move(where), .error = std::move(err)});
    }

    inline const DecodeError* DecodeError::find(const Location::Kind kind, const std::size_t index, const std::string_view name) const noexcept {
        for (const auto& [where, error] : causes_) {
            if (where.kind != kind)
                continue;
            if (kind == Location::Kind::Index ? where.index == index : where.name == name)
                return &error;
        }
        return nullptr;
    }

    inline const DecodeError* DecodeError::find_index(const std::size_t index) const noexcept {
        return find(Location::Kind::Index, index, {});
    }

    inline const DecodeError* DecodeError::find_field(const std::string_view field) const noexcept {
        return find(Location::Kind::Field, 0, field);
    }

    inline const DecodeError* DecodeError::find_key(const std::string_view key) const noexcept {
        return find(Location::Kind::Key, 0, key);
    }

    inline std::string DecodeError::to_string() const {
        std::string out;

        switch (code_) {
        case ErrorCode::None:
            return out;
        case ErrorCode::TypeMismatch:
            out.append("uplist: type mismatch: tried to decode plist type `");
            out.append(src_);
            out.append("' into value of type `");
            out.append(dest_);
            out.push_back('\'');
            return out;
        case ErrorCode::KeyType:
            out.append("uplist: attempt to decode dictionary into map with non-string key type `");
            out.append(dest_);
            out.push_back('\'');
            return out;
        case ErrorCode::InvalidLiteral:
            out.append(message_);
            out.append(" for value of type `");
            out.append(dest_);
            out.push_back('\'');
            return out;
        case ErrorCode::Multiple: {
            out.append(std::to_string(causes_.size()));
            out.append(causes_.size() == 1 ? " error occurred:\n\t" : " errors occurred:\n\t");
            for (std::size_t i = 0; i < causes_.size(); ++i) {
                if (i)
                    out.append("\n\t");
                out.append("* ");
                out.append(causes_[i].where.to_string());
                out.append(": ");
                out.append(causes_[i].error.to_string());
            }
            out.append("\n\n");
            return out;
        }
        default:
            break;
        }

        if (!message_.empty())
            return message_;

        out.append("uplist: ");
        out.append(error_code_name(code_));
        return out;
    }

    // ---- logging ----

    [[nodiscard]] inline std::shared_ptr<spdlog::logger> logger() {
        constexpr auto kName = "uplist";

        if (auto existing = spdlog::get(kName))
            return existing;

        const auto default_logger = spdlog::default_logger();
        auto created = default_logger ? default_logger->clone(kName) : std::make_shared<spdlog::logger>(kName);

        try {
            spdlog::register_logger(created);
        } catch (const spdlog::spdlog_ex&) {
            // registered concurrently by another thread
            if (auto existing = spdlog::get(kName))
                return existing;
        }
        return created;
    }

    // ---- decoding ----

    struct DecoderOptions {
        // coerce text into numbers, booleans and dates
        bool lax = false;
        std::uint32_t max_depth = kDefaultMaxDepth;
    };

    class Decoder;

    // Handed to decode_plist hooks; decodes the current node into any target.
    class DecodeInto {
    public:
        template <class U>
        DecodeError operator()(U& target) const;

        [[nodiscard]] ValueRef node() const noexcept {
            return node_;
        }

    private:
        friend class Decoder;

        DecodeInto(const Decoder& decoder, const ValueRef node, const std::uint32_t depth) noexcept: decoder_(&decoder), node_(node), depth_(depth) { }

        const Decoder* decoder_ {};
        ValueRef node_ {};
        std::uint32_t depth_ {};
    };

    template <class T, class M>
    struct Field {
        std::string_view name;
        M T::* member;
    };

    template <class T, class M>
    [[nodiscard]] constexpr Field<T, M> field(const std::string_view name, M T::* member) noexcept {
        return Field<T, M> {name, member};
    }

    // Specialize for types that cannot declare plist_fields() themselves.
    template <class T>
    struct record_fields;

    template <class T>
        requires requires { T::plist_fields(); }
    struct record_fields<T> {
        static auto describe() {
            return T::plist_fields();
        }
    };

    template <class T>
    concept Record = requires { record_fields<T>::describe(); };

    template <class T>
    struct FieldDescriptor {
        std::string_view name;
        bool writable {true};
        std::function<DecodeError(T&, const DecodeInto&)> decode {};
    };

    template <class T>
    class FieldTable {
    public:
        [[nodiscard]] bool ok() const noexcept {
            return error_.ok();
        }

        [[nodiscard]] const DecodeError& error() const noexcept {
            return error_;
        }

        [[nodiscard]] std::span<const FieldDescriptor<T>> fields() const noexcept {
            return fields_;
        }

        // built once per type, read-only afterwards
        [[nodiscard]] static const FieldTable& get() {
            static const FieldTable table = build();
            return table;
        }

    private:
        static FieldTable build() {
            FieldTable t;
            std::apply([&t](const auto&... f) { (t.add(f), ...); }, record_fields<T>::describe());

            std::unordered_set<std::string_view> seen;
            for (const auto& f : t.fields_) {
                if (f.name.empty()) {
                    t.error_ = DecodeError::unsupported_metadata(detail::cpp_type_name<T>(), "empty field name");
                    break;
                }
                if (!seen.insert(f.name).second) {
                    t.error_ = DecodeError::unsupported_metadata(detail::cpp_type_name<T>(), "duplicate field name `" + std::string {f.name} + "'");
                    break;
                }
            }
            return t;
        }

        template <class M>
        void add(const Field<T, M>& f) {
            FieldDescriptor<T> d;
            d.name = f.name;
            d.writable = !std::is_const_v<M>;
            if constexpr (!std::is_const_v<M>) {
                d.decode = [member = f.member](T& record, const DecodeInto& decode) { return decode(record.*member); };
            }
            fields_.push_back(std::move(d));
        }

        std::vector<FieldDescriptor<T>> fields_ {};
        DecodeError error_ {};
    };

    template <Record T>
    [[nodiscard]] const FieldTable<T>& describe() {
        return FieldTable<T>::get();
    }

    template <class T>
    concept Indirect = requires(T& t) {
        detail::allocate(t);
        *t;
    };

    template <class T>
    concept PlistDecodable = requires(T& t, const DecodeInto& into) {
        { t.decode_plist(into) } -> std::same_as<DecodeError>;
    };

    template <class T>
    concept TextDecodable = requires(T& t, std::string_view text) {
        { t.decode_text(text) } -> std::same_as<DecodeError>;
    };

    template <class T>
    concept TextSlot = std::same_as<T, std::string>;

    template <class T>
    concept SignedSlot = std::signed_integral<T>;

    template <class T>
    concept UnsignedSlot = std::unsigned_integral<T> && !std::same_as<T, bool>;

    template <class T>
    concept FloatSlot = std::same_as<T, float> || std::same_as<T, double>;

    template <class T>
    concept ByteType = std::same_as<T, std::uint8_t> || std::same_as<T, std::byte>;

    template <class T>
    concept GrowableBytes = detail::is_specialization_of<T, std::vector>::value && ByteType<typename T::value_type>;

    template <class T>
    concept FixedBytes = detail::is_std_array<T>::value && ByteType<typename T::value_type>;

    template <class T>
    concept GrowableSequence = !TextSlot<T> && requires(T& t, std::size_t n) {
        typename T::value_type;
        t.reserve(n);
        t.resize(n);
        { t.size() } -> std::convertible_to<std::size_t>;
        { t.capacity() } -> std::convertible_to<std::size_t>;
        { t[n] } -> std::same_as<typename T::value_type&>;
    };

    template <class T>
    concept FixedSequence = detail::is_std_array<T>::value;

    template <class T>
    concept MapLike = !Record<T> && requires(T& t) {
        typename T::key_type;
        typename T::mapped_type;
        t.insert_or_assign(std::declval<typename T::key_type>(), std::declval<typename T::mapped_type>());
    };

    template <class K>
    concept OwningTextKey = std::constructible_from<K, std::string> && !detail::is_specialization_of<std::remove_cv_t<K>, std::basic_string_view>::value;

    class Decoder {
    public:
        using Options = DecoderOptions;

        Decoder(): Decoder(Options {}) { }

        explicit Decoder(const Options opt): opt_(opt), log_(logger()) { }

        [[nodiscard]] const Options& options() const noexcept {
            return opt_;
        }

        // An absent node leaves dest untouched and succeeds.
        template <class T>
        [[nodiscard]] DecodeError decode(const ValueRef node, T& dest) const {
            return decode_value(node, dest, 0);
        }

    private:
        friend class DecodeInto;

        template <class T>
        DecodeError decode_value(ValueRef node, T& dest, std::uint32_t depth) const;

        template <class T>
        DecodeError decode_scalar(const Node* n, T& dest) const;

        template <class T>
        DecodeError decode_data(const Node* n, T& dest) const;

        template <class T>
        DecodeError decode_array(ValueRef node, T& dest, std::uint32_t depth) const;

        template <class T>
        DecodeError decode_dictionary(ValueRef node, T& dest, std::uint32_t depth) const;

        template <class T>
        DecodeError decode_lax(std::string_view text, T& dest) const;

        template <class T>
        [[nodiscard]] static DecodeError mismatch(const Type src) {
            return DecodeError::type_mismatch(detail::cpp_type_name<T>(), src);
        }

        Options opt_ {};
        std::shared_ptr<spdlog::logger> log_ {};
    };

    template <class U>
    DecodeError DecodeInto::operator()(U& target) const {
        return decoder_->decode_value(node_, target, depth_);
    }

    template <class T>
    DecodeError Decoder::decode_value(const ValueRef node, T& dest, const std::uint32_t depth) const {
        if (node.is_null())
            return {};

        if (depth > opt_.max_depth)
            return DecodeError::depth_exceeded(opt_.max_depth);

        if constexpr (Indirect<T>) {
            if (!dest)
                detail::allocate(dest);
            return decode_value(node, *dest, depth);
        } else if constexpr (std::same_as<T, Value>) {
            dest = to_value(node);
            return {};
        } else if constexpr (PlistDecodable<T>) {
            log_->trace("decode_plist hook for `{}'", detail::cpp_type_name<T>());
            return dest.decode_plist(DecodeInto {*this, node, depth + 1});
        } else {
            const Node* n = node.raw();

            if (n->type == Type::Date) {
                if constexpr (std::same_as<T, Date>) {
                    dest = Date {std::chrono::nanoseconds {n->data.date}};
                    return {};
                } else {
                    return mismatch<T>(n->type);
                }
            }

            if constexpr (TextDecodable<T> && !std::same_as<T, Date>) {
                if (n->type != Type::String)
                    return mismatch<T>(n->type);
                log_->trace("decode_text hook for `{}'", detail::cpp_type_name<T>());
                return dest.decode_text(n->data.str);
            } else {
                switch (n->type) {
                case Type::Array:
                    return decode_array(node, dest, depth);
                case Type::Dictionary:
                    return decode_dictionary(node, dest, depth);
                default:
                    return decode_scalar(n, dest);
                }
            }
        }
    }

    template <class T>
    DecodeError Decoder::decode_scalar(const Node* n, T& dest) const {
        switch (n->type) {
        case Type::String:
            if constexpr (TextSlot<T>) {
                dest.assign(n->data.str);
                return {};
            } else {
                if (opt_.lax)
                    return decode_lax(n->data.str, dest);
                return mismatch<T>(n->type);
            }

        case Type::Number:
            if constexpr (SignedSlot<T>) {
                dest = static_cast<T>(static_cast<std::int64_t>(n->data.num.value));
                return {};
            } else if constexpr (UnsignedSlot<T>) {
                dest = static_cast<T>(n->data.num.value);
                return {};
            } else if constexpr (std::same_as<T, Uid>) {
                dest.value = n->data.num.value;
                return {};
            } else {
                return mismatch<T>(n->type);
            }

        case Type::Real:
            // narrowing into float is not range checked
            if constexpr (FloatSlot<T>) {
                dest = static_cast<T>(n->data.real.value);
                return {};
            } else {
                return mismatch<T>(n->type);
            }

        case Type::Boolean:
            if constexpr (std::same_as<T, bool>) {
                dest = n->data.b;
                return {};
            } else {
                return mismatch<T>(n->type);
            }

        case Type::Data:
            return decode_data(n, dest);

        case Type::Uid:
            if constexpr (std::same_as<T, Uid>) {
                dest.value = n->data.uid;
                return {};
            } else if constexpr (SignedSlot<T>) {
                dest = static_cast<T>(static_cast<std::int64_t>(n->data.uid));
                return {};
            } else if constexpr (UnsignedSlot<T>) {
                dest = static_cast<T>(n->data.uid);
                return {};
            } else {
                return mismatch<T>(n->type);
            }

        case Type::Date:
        case Type::Array:
        case Type::Dictionary:
            break;
        }

        return DecodeError::unknown_node(n->type);
    }

    template <class T>
    DecodeError Decoder::decode_data(const Node* n, T& dest) const {
        const std::size_t size = n->data.bytes.size;

        if constexpr (GrowableBytes<T>) {
            dest.resize(size);
            if (size)
                std::memcpy(dest.data(), n->data.bytes.ptr, size);
            return {};
        } else if constexpr (FixedBytes<T>) {
            // bytes past the payload keep their previous contents
            if (dest.size() < size)
                return DecodeError::size_exceeded(size, dest.size(), "bytes", "a byte array");
            if (size)
                std::memcpy(dest.data(), n->data.bytes.ptr, size);
            return {};
        } else {
            return mismatch<T>(n->type);
        }
    }

    template <class T>
    DecodeError Decoder::decode_array(const ValueRef node, T& dest, const std::uint32_t depth) const {
        if constexpr (!GrowableSequence<T> && !FixedSequence<T>) {
            return mismatch<T>(Type::Array);
        } else {
            const std::size_t count = node.size();
            std::size_t n = 0;

            if constexpr (GrowableSequence<T>) {
                const std::size_t total = static_cast<std::size_t>(dest.size()) + count;
                if (total > static_cast<std::size_t>(dest.capacity())) {
                    auto cap = static_cast<std::size_t>(dest.capacity());
                    while (cap < total)
                        cap = detail::grow_capacity(cap);
                    dest.reserve(cap);
                }
                n = dest.size();
                dest.resize(total);
            } else {
                if (count > std::tuple_size_v<T>)
                    return DecodeError::size_exceeded(count, std::tuple_size_v<T>, "values", "an array");
            }

            DecodeError result;
            for (const ValueRef item : node.items()) {
                if (auto err = decode_value(item, dest[n], depth + 1); !err)
                    result.append(Location::at_index(n), std::move(err));
                ++n;
            }

            if (!result)
                log_->debug("array decode into `{}': {} of {} elements failed", detail::cpp_type_name<T>(), result.size(), count);
            return result;
        }
    }

    template <class T>
    DecodeError Decoder::decode_dictionary(const ValueRef node, T& dest, const std::uint32_t depth) const {
        if constexpr (Record<T>) {
            const auto& table = describe<T>();
            if (!table.ok())
                return table.error();

            std::unordered_map<std::string_view, ValueRef> entries;
            entries.reserve(node.size());
            for (const auto [key, value] : node.members()) {
                if (!value.is_null())
                    entries.insert_or_assign(key, value);
            }

            DecodeError result;
            for (const auto& f : table.fields()) {
                const auto it = entries.find(f.name);
                if (it == entries.end())
                    continue;

                if (!f.writable) {
                    result.append(Location::at_field(f.name), DecodeError::unwritable_field(f.name));
                    continue;
                }

                if (auto err = f.decode(dest, DecodeInto {*this, it->second, depth + 1}); !err)
                    result.append(Location::at_field(f.name), std::move(err));
            }

            if (!result)
                log_->debug("record decode into `{}': {} fields failed", detail::cpp_type_name<T>(), result.size());
            return result;
        } else if constexpr (MapLike<T>) {
            using Key = typename T::key_type;
            using Elem = typename T::mapped_type;

            // keys must own their text; views would outlive the tree
            if constexpr (!OwningTextKey<Key>) {
                return DecodeError::key_type(detail::cpp_type_name<Key>());
            } else {
                DecodeError result;
                for (const auto [key, value] : node.members()) {
                    if (value.is_null())
                        continue;

                    Elem elem {};
                    if (auto err = decode_value(value, elem, depth + 1); !err) {
                        result.append(Location::at_key(key), std::move(err));
                        continue;
                    }
                    dest.insert_or_assign(Key {std::string {key}}, std::move(elem));
                }

                if (!result)
                    log_->debug("map decode into `{}': {} keys failed", detail::cpp_type_name<T>(), result.size());
                return result;
            }
        } else {
            return mismatch<T>(Type::Dictionary);
        }
    }

    template <class T>
    DecodeError Decoder::decode_lax(const std::string_view text, T& dest) const {
        log_->trace("lax coercion of `{}' into `{}'", text, detail::cpp_type_name<T>());

        if constexpr (SignedSlot<T>) {
            std::int64_t v {};
            if (!detail::parse_i64(text, v))
                return DecodeError::invalid_literal(text, "integer", detail::cpp_type_name<T>());
            dest = static_cast<T>(v);
            return {};
        } else if constexpr (UnsignedSlot<T> || std::same_as<T, Uid>) {
            std::uint64_t v {};
            if (!detail::parse_u64(text, v))
                return DecodeError::invalid_literal(text, "unsigned integer", detail::cpp_type_name<T>());
            if constexpr (std::same_as<T, Uid>)
                dest.value = v;
            else
                dest = static_cast<T>(v);
            return {};
        } else if constexpr (FloatSlot<T>) {
            double v {};
            if (!detail::parse_f64(text, v))
                return DecodeError::invalid_literal(text, "real", detail::cpp_type_name<T>());
            dest = static_cast<T>(v);
            return {};
        } else if constexpr (std::same_as<T, bool>) {
            bool v {};
            if (!detail::parse_bool(text, v))
                return DecodeError::invalid_literal(text, "boolean", detail::cpp_type_name<T>());
            dest = v;
            return {};
        } else if constexpr (std::same_as<T, Date>) {
            Date v {};
            if (!detail::parse_text_date(text, v))
                return DecodeError::invalid_literal(text, "date", detail::cpp_type_name<T>());
            dest = v;
            return {};
        } else {
            return mismatch<T>(Type::String);
        }
    }

    template <class T>
    [[nodiscard]] DecodeError decode(const ValueRef node, T& dest, const DecoderOptions opt = {}) {
        return Decoder {opt}.decode(node, dest);
    }

} // namespace uplist

namespace uplist {

    enum class StringPolicy : std::uint8_t {
        View,
        Copy
    };

    struct BuilderOptions {
        // applies to strings, keys and data payloads
        StringPolicy strings = StringPolicy::Copy;
    };

    class TreeBuilder;

    class NodeRef {
    public:
        NodeRef() = default;

        [[nodiscard]] bool ok() const noexcept;

        [[nodiscard]] Node* raw() const noexcept {
            Node** s = slot();
            return s ? *s : nullptr;
        }

        [[nodiscard]] ValueRef view() const noexcept {
            return ValueRef {raw()};
        }

        const NodeRef& set_array(std::uint32_t cap = 4) const;
        const NodeRef& set_dictionary(std::uint32_t cap = 4) const;

        template <class T>
        const NodeRef& operator=(T&& v) const;

        // ---- dictionary ----
        // Appends an entry; earlier entries with the same key are kept.
        template <class T>
        NodeRef add(std::string_view key, T&& v) const;

        [[nodiscard]] NodeRef add_array(std::string_view key, std::uint32_t cap = 4) const;
        [[nodiscard]] NodeRef add_dictionary(std::string_view key, std::uint32_t cap = 4) const;

        // ---- array ----
        template <class T>
        NodeRef add(T&& v) const;

        [[nodiscard]] NodeRef add_array(std::uint32_t cap = 4) const;
        [[nodiscard]] NodeRef add_dictionary(std::uint32_t cap = 4) const;

        [[nodiscard]] std::uint32_t size() const noexcept {
            const Node* n = raw();
            return n && Node::is_container(n->type) ? n->data.kids.count : 0;
        }

    private:
        friend class TreeBuilder;

        NodeRef(TreeBuilder* b, Node* parent, const std::uint32_t index) noexcept: b_(b), parent_(parent), index_(index) { }

        [[nodiscard]] Node** slot() const noexcept;

        TreeBuilder* b_ {};
        Node* parent_ {}; // null for the root
        std::uint32_t index_ {};
    };

    class TreeBuilder : ArenaHolder {
    public:
        using Options = BuilderOptions;

        explicit TreeBuilder(const Options opt = {}): ArenaHolder {true}, opt_(opt) { }

        explicit TreeBuilder(Arena& arena, const Options opt = {}): ArenaHolder {arena}, opt_(opt) { }

        template <AllocatorLike Allocator>
        explicit TreeBuilder(Allocator& alloc, const Options opt = {}): ArenaHolder {alloc}, opt_(opt) { }

        [[nodiscard]] UPLIST_FORCEINLINE bool ok() const noexcept {
            return err_ == ErrorCode::None;
        }

        [[nodiscard]] UPLIST_FORCEINLINE ErrorCode error() const noexcept {
            return err_;
        }

        [[nodiscard]] UPLIST_FORCEINLINE Arena& arena() const noexcept {
            return ArenaHolder::arena();
        }

        [[nodiscard]] UPLIST_FORCEINLINE NodeRef root() noexcept {
            return NodeRef {this, nullptr, 0};
        }

        [[nodiscard]] UPLIST_FORCEINLINE ValueRef view() const noexcept {
            return ValueRef {root_};
        }

    private:
        friend class NodeRef;

        UPLIST_FORCEINLINE void set_err(const ErrorCode c) noexcept {
            if (err_ == ErrorCode::None)
                err_ = c;
        }

        [[nodiscard]] std::string_view materialize(const std::string_view s) {
            if (opt_.strings == StringPolicy::View || s.empty())
                return s;

            auto* p = static_cast<char*>(arena().alloc(s.size() + 1, 1));
            if (!p) {
                set_err(ErrorCode::OutOfMemory);
                return {};
            }
            std::memcpy(p, s.data(), s.size());
            p[s.size()] = '\0';
            return {p, s.size()};
        }

        [[nodiscard]] const std::uint8_t* materialize_bytes(const std::uint8_t* data, const std::size_t size) {
            if (opt_.strings == StringPolicy::View || size == 0)
                return data;

            auto* p = arena().make_array<std::uint8_t>(size);
            if (!p) {
                set_err(ErrorCode::OutOfMemory);
                return nullptr;
            }
            std::memcpy(p, data, size);
            return p;
        }

        [[nodiscard]] Node* make_node(const Type t) {
            Node* n = arena().make<Node>();
            if (!n) {
                set_err(ErrorCode::OutOfMemory);
                return nullptr;
            }
            n->type = t;
            n->key = {};
            return n;
        }

        [[nodiscard]] Node* make_container(const Type t, std::uint32_t cap) {
            cap = std::max(1u, cap);
            Node* n = make_node(t);
            if (!n)
                return nullptr;

            Node** items = arena().make_array<Node*>(cap);
            if (!items) {
                set_err(ErrorCode::OutOfMemory);
                return nullptr;
            }

            n->data.kids.count = 0;
            n->data.kids.capacity = cap;
            n->data.kids.items = items;
            return n;
        }

        // grows the items array in place so child NodeRefs stay valid
        bool append(Node* container, Node* child, std::uint32_t& index) {
            if (!container || !Node::is_container(container->type)) {
                set_err(ErrorCode::BuilderInvalidState);
                return false;
            }

            auto& k = container->data.kids;
            if (k.count >= k.capacity) {
                if (k.capacity > std::numeric_limits<std::uint32_t>::max() / 2u) {
                    set_err(ErrorCode::OutOfMemory);
                    return false;
                }

                const std::uint32_t new_cap = k.capacity ? k.capacity * 2u : 4u;
                Node** bigger = arena().make_array<Node*>(new_cap);
                if (!bigger) {
                    set_err(ErrorCode::OutOfMemory);
                    return false;
                }
                if (k.items && k.count)
                    std::memcpy(bigger, k.items, k.count * sizeof(Node*));

                k.items = bigger;
                k.capacity = new_cap;
            }

            index = k.count;
            k.items[k.count++] = child;
            return true;
        }

        bool ensure_container(const NodeRef& self, const Type t, const std::uint32_t cap) {
            Node** s = self.slot();
            if (!ok() || !s)
                return false;

            const Node* cur = *s;
            if (cur && cur->type == t)
                return true;

            Node* n = make_container(t, cap);
            if (!n)
                return false;

            if (cur)
                n->key = cur->key;

            *s = n;
            return true;
        }

        template <class T>
        [[nodiscard]] Node* make_from_value(T&& v) { // NOLINT(cppcoreguidelines-missing-std-forward)
            using U = std::decay_t<std::remove_cvref_t<T>>;

            if constexpr (std::is_same_v<U, bool>) {
                Node* n = make_node(Type::Boolean);
                if (!n)
                    return nullptr;
                n->data.b = v;
                return n;
            } else if constexpr (std::is_integral_v<U>) {
                Node* n = make_node(Type::Number);
                if (!n)
                    return nullptr;
                if constexpr (std::is_signed_v<U>) {
                    n->data.num.value = static_cast<std::uint64_t>(static_cast<std::int64_t>(v));
                    n->data.num.is_signed = true;
                } else {
                    n->data.num.value = static_cast<std::uint64_t>(v);
                    n->data.num.is_signed = false;
                }
                return n;
            } else if constexpr (std::is_floating_point_v<U>) {
                Node* n = make_node(Type::Real);
                if (!n)
                    return nullptr;
                n->data.real.value = static_cast<double>(v);
                n->data.real.wide = !std::is_same_v<U, float>;
                return n;
            } else if constexpr (std::is_same_v<U, std::string_view> || std::is_same_v<U, std::string>) {
                Node* n = make_node(Type::String);
                if (!n)
                    return nullptr;
                n->data.str = materialize(v);
                return n;
            } else if constexpr (std::is_same_v<U, const char*> || std::is_same_v<U, char*>) {
                Node* n = make_node(Type::String);
                if (!n)
                    return nullptr;
                n->data.str = materialize(std::string_view {v ? v : ""});
                return n;
            } else if constexpr (std::is_same_v<U, Bytes> || std::is_same_v<U, std::span<const std::uint8_t>>) {
                Node* n = make_node(Type::Data);
                if (!n)
                    return nullptr;
                if (v.size() > std::numeric_limits<std::uint32_t>::max()) {
                    set_err(ErrorCode::OutOfMemory);
                    return nullptr;
                }
                n->data.bytes.ptr = materialize_bytes(v.data(), v.size());
                n->data.bytes.size = static_cast<std::uint32_t>(v.size());
                return n;
            } else if constexpr (std::is_same_v<U, Date>) {
                Node* n = make_node(Type::Date);
                if (!n)
                    return nullptr;
                n->data.date = v.time_since_epoch().count();
                return n;
            } else if constexpr (std::is_same_v<U, Uid>) {
                Node* n = make_node(Type::Uid);
                if (!n)
                    return nullptr;
                n->data.uid = v.value;
                return n;
            } else if constexpr (std::is_same_v<U, Value>) {
                return make_from_dynamic(v);
            } else if constexpr (std::is_same_v<U, Node*>) {
                return v;
            } else {
                static_assert(!sizeof(U), "Unsupported value type for TreeBuilder");
                return nullptr;
            }
        }

        // std::monostate yields no node
        [[nodiscard]] Node* make_from_dynamic(const Value& v) {
            return std::visit(
                [this](const auto& x) -> Node* {
                    using U = std::decay_t<decltype(x)>;

                    if constexpr (std::is_same_v<U, std::monostate>) {
                        return nullptr;
                    } else if constexpr (std::is_same_v<U, ValueArray>) {
                        Node* arr = make_container(Type::Array, static_cast<std::uint32_t>(x.size()));
                        if (!arr)
                            return nullptr;
                        for (const auto& item : x) {
                            Node* child = make_from_dynamic(item);
                            if (!child && !item.is_null())
                                return nullptr;
                            std::uint32_t index {};
                            if (!append(arr, child, index))
                                return nullptr;
                        }
                        return arr;
                    } else if constexpr (std::is_same_v<U, ValueDictionary>) {
                        Node* dict = make_container(Type::Dictionary, static_cast<std::uint32_t>(x.size()));
                        if (!dict)
                            return nullptr;
                        for (const auto& [key, item] : x) {
                            // an entry needs a node to carry its key
                            if (item.is_null())
                                continue;
                            Node* child = make_from_dynamic(item);
                            if (!child)
                                return nullptr;
                            child->key = materialize(key);
                            std::uint32_t index {};
                            if (!append(dict, child, index))
                                return nullptr;
                        }
                        return dict;
                    } else {
                        return make_from_value(x);
                    }
                },
                v.base());
        }

        Options opt_ {};
        Node* root_ {};
        ErrorCode err_ {ErrorCode::None};
    };

    inline Node** NodeRef::slot() const noexcept {
        if (!b_)
            return nullptr;
        if (!parent_)
            return &b_->root_;

        const auto& k = parent_->data.kids;
        return index_ < k.count ? &k.items[index_] : nullptr;
    }

    inline bool NodeRef::ok() const noexcept {
        return b_ && b_->ok() && slot();
    }

    inline const NodeRef& NodeRef::set_array(const std::uint32_t cap) const {
        if (ok())
            (void)b_->ensure_container(*this, Type::Array, cap);
        return *this;
    }

    inline const NodeRef& NodeRef::set_dictionary(const std::uint32_t cap) const {
        if (ok())
            (void)b_->ensure_container(*this, Type::Dictionary, cap);
        return *this;
    }

    template <class T>
    const NodeRef& NodeRef::operator=(T&& v) const {
        if (!ok())
            return *this;

        Node** s = slot();
        const Node* old = *s;

        Node* nn = b_->make_from_value(std::forward<T>(v));
        if (!nn && b_->ok() && parent_ && parent_->type == Type::Dictionary) {
            // a dictionary entry always carries a node
            b_->set_err(ErrorCode::BuilderInvalidState);
            return *this;
        }
        if (nn && old)
            nn->key = old->key;
        if (nn || b_->ok())
            *s = nn;
        return *this;
    }

    template <class T>
    NodeRef NodeRef::add(const std::string_view key, T&& v) const {
        if (!ok())
            return {};
        (void)set_dictionary();

        Node* dict = raw();
        if (!dict || dict->type != Type::Dictionary)
            return {};

        Node* child = b_->make_from_value(std::forward<T>(v));
        if (!child)
            return {};
        child->key = b_->materialize(key);

        std::uint32_t index {};
        if (!b_->append(dict, child, index))
            return {};
        return NodeRef {b_, dict, index};
    }

    inline NodeRef NodeRef::add_array(const std::string_view key, const std::uint32_t cap) const {
        if (!ok())
            return {};
        (void)set_dictionary();

        Node* dict = raw();
        if (!dict || dict->type != Type::Dictionary)
            return {};

        Node* child = b_->make_container(Type::Array, cap);
        if (!child)
            return {};
        child->key = b_->materialize(key);

        std::uint32_t index {};
        if (!b_->append(dict, child, index))
            return {};
        return NodeRef {b_, dict, index};
    }

    inline NodeRef NodeRef::add_dictionary(const std::string_view key, const std::uint32_t cap) const {
        if (!ok())
            return {};
        (void)set_dictionary();

        Node* dict = raw();
        if (!dict || dict->type != Type::Dictionary)
            return {};

        Node* child = b_->make_container(Type::Dictionary, cap);
        if (!child)
            return {};
        child->key = b_->materialize(key);

        std::uint32_t index {};
        if (!b_->append(dict, child, index))
            return {};
        return NodeRef {b_, dict, index};
    }

    template <class T>
    NodeRef NodeRef::add(T&& v) const {
        if (!ok())
            return {};
        (void)set_array();

        Node* arr = raw();
        if (!arr || arr->type != Type::Array)
            return {};

        Node* child = b_->make_from_value(std::forward<T>(v));
        if (!child && !b_->ok())
            return {};

        std::uint32_t index {};
        if (!b_->append(arr, child, index))
            return {};
        return NodeRef {b_, arr, index};
    }

    inline NodeRef NodeRef::add_array(const std::uint32_t cap) const {
        if (!ok())
            return {};
        (void)set_array();

        Node* arr = raw();
        if (!arr || arr->type != Type::Array)
            return {};

        Node* child = b_->make_container(Type::Array, cap);
        if (!child)
            return {};

        std::uint32_t index {};
        if (!b_->append(arr, child, index))
            return {};
        return NodeRef {b_, arr, index};
    }

    inline NodeRef NodeRef::add_dictionary(const std::uint32_t cap) const {
        if (!ok())
            return {};
        (void)set_array();

        Node* arr = raw();
        if (!arr || arr->type != Type::Array)
            return {};

        Node* child = b_->make_container(Type::Dictionary, cap);
        if (!child)
            return {};

        std::uint32_t index {};
        if (!b_->append(arr, child, index))
            return {};
        return NodeRef {b_, arr, index};
    }

} // namespace uplist

#endif // UPLIST_HPP
