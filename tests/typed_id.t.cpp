#include <catch2/catch.hpp>
#include <fmt/format.h>
#include <typid/typed_id.hpp>
#include <algorithm>
#include <mutex>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace {
using typid::TypedId;
using typid::Uuid;

struct Foo {
	TypedId<Foo> id{};
};

struct Bar {
	TypedId<Bar> id{};
};

// never defined: tags may stay incomplete
struct Opaque;

static_assert(sizeof(TypedId<Foo>) == sizeof(Uuid));
static_assert(sizeof(TypedId<Foo>) == 16);
static_assert(sizeof(TypedId<Opaque>) == sizeof(TypedId<Bar>));
static_assert(std::is_trivially_copyable_v<TypedId<Foo>>);
static_assert(std::is_standard_layout_v<TypedId<Foo>>);

static_assert(!std::is_convertible_v<TypedId<Foo>, TypedId<Bar>>);
static_assert(!std::is_constructible_v<TypedId<Foo>, TypedId<Bar>>);
static_assert(!std::is_assignable_v<TypedId<Foo>&, TypedId<Bar>>);
static_assert(!std::is_constructible_v<TypedId<Foo>, Uuid>);
static_assert(!std::is_convertible_v<TypedId<Foo>, Uuid>);
static_assert(!std::equality_comparable_with<TypedId<Foo>, TypedId<Bar>>);
static_assert(!std::totally_ordered_with<TypedId<Foo>, TypedId<Bar>>);
static_assert(std::totally_ordered<TypedId<Foo>>);

constexpr auto sample_bytes_v = Uuid::Bytes{0x55, 0x0e, 0x84, 0x00, 0xe2, 0x9b, 0x41, 0xd4, 0xa7, 0x16, 0x44, 0x66, 0x55, 0x44, 0x00, 0x00};

template <typename Type>
std::vector<TypedId<Type>> make_ids(std::size_t const count) {
	auto ret = std::vector<TypedId<Type>>{};
	ret.reserve(count);
	for (std::size_t i = 0; i < count; ++i) { ret.push_back(TypedId<Type>::make()); }
	return ret;
}
} // namespace

TEST_CASE("typed_id uniqueness") {
	auto const a = Foo{};
	auto const b = Foo{};
	REQUIRE(a.id != b.id);

	auto const ids = make_ids<Foo>(1000);
	auto const set = std::unordered_set<TypedId<Foo>>{ids.begin(), ids.end()};
	REQUIRE(set.size() == ids.size());
	for (auto const& id : ids) { REQUIRE(id.uuid().version() == 4); }
}

TEST_CASE("typed_id text round trip") {
	auto const id = TypedId<Foo>::from_bytes(sample_bytes_v);
	REQUIRE(id.to_string() == "550e8400-e29b-41d4-a716-446655440000");
	REQUIRE(fmt::format("{}", id) == "550e8400-e29b-41d4-a716-446655440000");

	auto const parsed = TypedId<Foo>::from_str(id.to_string());
	REQUIRE(parsed);
	REQUIRE(*parsed == id);
	REQUIRE(TypedId<Foo>::parse("550e8400-e29b-41d4-a716-446655440000") == id);

	for (auto const& random : make_ids<Bar>(32)) {
		auto const result = TypedId<Bar>::from_str(random.to_string());
		REQUIRE(result);
		REQUIRE(*result == random);
	}
}

TEST_CASE("typed_id parse failure") {
	auto const result = TypedId<Foo>::from_str("not-a-uuid");
	REQUIRE_FALSE(result);
	REQUIRE_FALSE(result.value.has_value());
	REQUIRE(result.failure.input == "not-a-uuid");

	REQUIRE_THROWS_AS(TypedId<Foo>::parse("not-a-uuid"), typid::ParseError);
}

TEST_CASE("typed_id bytes and uuid") {
	auto const a = TypedId<Foo>::from_bytes(sample_bytes_v);
	auto const b = TypedId<Foo>::from_bytes(sample_bytes_v);
	REQUIRE(a == b);
	REQUIRE(a.hash() == b.hash());
	REQUIRE(a.bytes() == sample_bytes_v);
	REQUIRE(a.uuid() == Uuid::from_bytes(sample_bytes_v));

	// same payload under another tag: only comparable after erasing the tag
	auto const bar = TypedId<Bar>::from_bytes(sample_bytes_v);
	REQUIRE(bar.uuid() == a.uuid());
	REQUIRE(TypedId<Opaque>::from_bytes(a.bytes()).to_string() == a.to_string());
}

TEST_CASE("typed_id ordering") {
	auto ids = make_ids<Foo>(64);
	ids.push_back(ids.front());

	for (auto const& x : ids) {
		for (auto const& y : ids) {
			auto const count = int(x < y) + int(x == y) + int(x > y);
			REQUIRE(count == 1);
			REQUIRE((x < y) == (x.uuid() < y.uuid()));
			for (auto const& z : ids) {
				if (x < y && y < z) { REQUIRE(x < z); }
			}
		}
	}

	auto shuffled = ids;
	std::reverse(shuffled.begin(), shuffled.end());
	std::sort(ids.begin(), ids.end());
	std::sort(shuffled.begin(), shuffled.end());
	REQUIRE(ids == shuffled);
	REQUIRE(std::is_sorted(ids.begin(), ids.end(), [](auto const& a, auto const& b) { return a.bytes() < b.bytes(); }));
}

TEST_CASE("typed_id hash") {
	auto const id = TypedId<Foo>::from_bytes(sample_bytes_v);
	REQUIRE(std::hash<TypedId<Foo>>{}(id) == id.uuid().hash());
	REQUIRE(TypedId<Foo>::Hasher{}(id) == std::hash<TypedId<Foo>>{}(id));

	auto map = std::unordered_map<TypedId<Foo>, int, TypedId<Foo>::Hasher>{};
	map[id] = 1;
	map[TypedId<Foo>::parse(id.to_string())] = 2;
	REQUIRE(map.size() == 1);
	REQUIRE(map.at(id) == 2);
}

TEST_CASE("typed_id concurrent generation") {
	constexpr std::size_t threads_v{4};
	constexpr std::size_t per_thread_v{256};

	auto mutex = std::mutex{};
	auto all = std::vector<TypedId<Foo>>{};
	{
		auto workers = std::vector<std::jthread>{};
		for (std::size_t i = 0; i < threads_v; ++i) {
			workers.emplace_back([&] {
				auto ids = make_ids<Foo>(per_thread_v);
				auto lock = std::scoped_lock{mutex};
				all.insert(all.end(), ids.begin(), ids.end());
			});
		}
	}

	REQUIRE(all.size() == threads_v * per_thread_v);
	auto const set = std::unordered_set<TypedId<Foo>>{all.begin(), all.end()};
	REQUIRE(set.size() == all.size());
}
