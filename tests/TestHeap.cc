#include <gtest/gtest.h>

#include <string>

#include "ndl-core/equality.hh"
#include "ndl-core/feedback.hh"
#include "ndl-core/heap.hh"
#include "ndl-core/int.hh"
#include "ndl-core/refcount.hh"

///
/// HEAP LAYOUT TESTS
///

TEST(HeapTests, TextLayout) {
    ndl::Heap heap;
    ndl::HeapText text = ndl::HeapText::create(heap, true, "hello, world");
    EXPECT_EQ(text.kind(), ndl::HeapKind::Text);
    EXPECT_TRUE(text.is_reference_counted());
    EXPECT_EQ(text.refcount(), 1u);
    EXPECT_EQ(text.byte_len(), 12u);
    EXPECT_EQ(text.fields(), 12u);
    EXPECT_EQ(text.content_word_count(), 2u);
    EXPECT_EQ(text.word_count(), 4u);
    EXPECT_EQ(text.text(), "hello, world");
    // zero-padded to a whole word
    EXPECT_EQ(reinterpret_cast<char const*>(text.content())[12], '\0');
    EXPECT_EQ(text.header() & 0xF, (0x2u | 0x8u));
}

TEST(HeapTests, EmptyObjectsAreLegal) {
    ndl::Heap heap;
    ndl::HeapText text = ndl::HeapText::create(heap, true, "");
    ndl::HeapList list = ndl::HeapList::create(heap, true, {});
    ndl::HeapStruct record = ndl::HeapStruct::create(heap, true, {});
    EXPECT_EQ(text.word_count(), 2u);
    EXPECT_EQ(list.word_count(), 2u);
    EXPECT_EQ(record.word_count(), 2u);
    EXPECT_EQ(list.len(), 0u);
    EXPECT_EQ(record.len(), 0u);
}

TEST(HeapTests, UncountedObjectsHaveNoCountWord) {
    ndl::Heap heap;
    ndl::HeapForeignId foreign = ndl::HeapForeignId::create(heap, false, 0xDEADBEEF);
    EXPECT_FALSE(foreign.is_reference_counted());
    EXPECT_EQ(foreign.word_count(), 2u);
    EXPECT_EQ(foreign.id(), 0xDEADBEEFu);
    EXPECT_EQ(foreign.content(), foreign.address() + 1);
}

TEST(HeapTests, FunctionLayout) {
    ndl::Heap heap;
    std::vector<ndl::OBJECT> captured = {ndl::OBJECT::make_int(1), ndl::OBJECT::make_symbol(ndl::sym::True)};
    ndl::HeapFunction fn = ndl::HeapFunction::create(heap, true, 77, 3, captured);
    EXPECT_EQ(fn.kind(), ndl::HeapKind::Function);
    EXPECT_EQ(fn.argc(), 3u);
    EXPECT_EQ(fn.captured_count(), 2u);
    EXPECT_EQ(fn.body(), 77u);
    EXPECT_EQ(fn.captured(0), ndl::OBJECT::make_int(1));
    EXPECT_EQ(fn.captured(1), ndl::OBJECT::make_symbol(ndl::sym::True));
    // argc in header bits 31..4, capture count in 63..32
    EXPECT_EQ((fn.header() >> 4) & 0x0FFFFFFF, 3u);
    EXPECT_EQ(fn.header() >> 32, 2u);
}

TEST(HeapTests, TagLayout) {
    ndl::Heap heap;
    ndl::HeapTag tag = ndl::HeapTag::create(heap, true, ndl::sym::Ok, ndl::OBJECT::make_int(5));
    EXPECT_EQ(tag.symbol(), ndl::sym::Ok);
    ASSERT_TRUE(tag.value().has_value());
    EXPECT_EQ(*tag.value(), ndl::OBJECT::make_int(5));
    EXPECT_THROW(ndl::HeapTag::create(heap, true, ndl::sym::Ok, ndl::OBJECT::none), ndl::FatalError);
}

TEST(HeapTests, StructIsSortedByHashAndDeduplicated) {
    ndl::Heap heap;
    std::vector<std::pair<ndl::OBJECT, ndl::OBJECT>> fields;
    for (int64_t i = 0; i < 8; i++) {
        fields.emplace_back(ndl::OBJECT::make_int(i), ndl::OBJECT::make_int(i * 10));
    }
    fields.emplace_back(ndl::OBJECT::make_int(3), ndl::OBJECT::make_int(333));
    ndl::HeapStruct record = ndl::HeapStruct::create(heap, true, fields);

    EXPECT_EQ(record.len(), 8u);
    for (size_t i = 1; i < record.len(); i++) {
        EXPECT_LE(record.hash(i - 1), record.hash(i));
    }
    for (size_t i = 0; i < record.len(); i++) {
        EXPECT_EQ(record.hash(i), ndl::hash_value(record.key(i)));
    }
    auto three = record.get(ndl::OBJECT::make_int(3));
    ASSERT_TRUE(three.has_value());
    EXPECT_EQ(*three, ndl::OBJECT::make_int(333));
    EXPECT_FALSE(record.contains(ndl::OBJECT::make_int(8)));
}

TEST(HeapTests, StructKeysCompareStructurally) {
    ndl::Heap heap;
    ndl::OBJECT key = ndl::HeapText::create(heap, true, "name").to_object();
    ndl::OBJECT value = ndl::HeapText::create(heap, true, "needle").to_object();
    ndl::OBJECT record = ndl::HeapStruct::create(heap, true, {{key, value}}).to_object();

    ndl::OBJECT probe = ndl::HeapText::create(heap, true, "name").to_object();
    EXPECT_TRUE(ndl::HeapStruct(record.as_ptr()).contains(probe));

    ndl::release(heap, probe);
    ndl::release(heap, record);
    EXPECT_EQ(heap.stats().live_object_count, 0u);
}

TEST(HeapTests, BigIntsLiveOnTheHeap) {
    ndl::Heap heap;
    mpz_class big{"1180591620717411303424"};    // 2^70
    ndl::OBJECT v = ndl::make_int(heap, big);
    ASSERT_TRUE(v.is_ptr());
    ndl::HeapInt it{v.as_ptr()};
    EXPECT_EQ(it.kind(), ndl::HeapKind::Int);
    EXPECT_EQ(it.to_mpz(), big);

    ndl::OBJECT small = ndl::make_int(heap, mpz_class{42});
    EXPECT_TRUE(small.is_int());
    EXPECT_EQ(small.as_int(), 42);

    ndl::release(heap, v);
    EXPECT_EQ(heap.stats().live_object_count, 0u);
}

TEST(HeapTests, BigIntLimbsCountTowardsTheLimit) {
    ndl::Heap heap;
    mpz_class big = mpz_class{1} << 640;         // 11 limbs
    ndl::OBJECT v = ndl::make_int(heap, big);
    EXPECT_EQ(heap.stats().live_word_count, 2 + ndl::HeapInt::CONTENT_WORD_COUNT + 11);
    ndl::release(heap, v);
    EXPECT_EQ(heap.stats().live_word_count, 0u);

    ndl::Heap limited{64};
    EXPECT_THROW(ndl::make_int(limited, mpz_class{1} << 64 * 64), ndl::ResourceExhaustedError);
    EXPECT_EQ(limited.stats().live_object_count, 0u);
}

TEST(HeapTests, IntGrowthIsBoundedBeforeComputing) {
    ndl::Heap heap{64};
    ndl::OBJECT x = ndl::make_int(heap, mpz_class{1} << 40 * 64);
    EXPECT_THROW(ndl::int_multiply(heap, x, x), ndl::ResourceExhaustedError);
    EXPECT_THROW(ndl::int_shift_left(heap, ndl::OBJECT::make_int(1), 100 * 64), ndl::ResourceExhaustedError);

    // zero stays zero, however far it is shifted
    EXPECT_EQ(ndl::int_shift_left(heap, ndl::OBJECT::make_int(0), 1000000000), ndl::OBJECT::make_int(0));

    ndl::release(heap, x);
    EXPECT_EQ(heap.stats().live_word_count, 0u);
}

TEST(HeapTests, LargeObjectsGetTheirOwnBlock) {
    ndl::Heap heap;
    std::vector<ndl::OBJECT> items(1000, ndl::OBJECT::make_int(7));
    ndl::HeapList list = ndl::HeapList::create(heap, true, items);
    EXPECT_EQ(list.len(), 1000u);
    EXPECT_EQ(list.get(999), ndl::OBJECT::make_int(7));
    EXPECT_TRUE(heap.owns(list.address()));
    ndl::release(heap, list.to_object());
    EXPECT_FALSE(heap.owns(list.address()));
}

TEST(HeapTests, FreedSlotsAreReused) {
    ndl::Heap heap;
    ndl::OBJECT a = ndl::HeapText::create(heap, true, "abc").to_object();
    ndl::Word* address = a.as_ptr();
    ndl::release(heap, a);
    ndl::OBJECT b = ndl::HeapText::create(heap, true, "xyz").to_object();
    EXPECT_EQ(b.as_ptr(), address);
    EXPECT_EQ(heap.stats().allocation_count, 2u);
    EXPECT_EQ(heap.stats().deallocation_count, 1u);
    ndl::release(heap, b);
}

TEST(HeapTests, LimitRaisesResourceExhausted) {
    ndl::Heap heap{16};
    ndl::OBJECT a = ndl::HeapText::create(heap, true, std::string(64, 'a')).to_object();
    EXPECT_EQ(heap.stats().live_word_count, 10u);
    EXPECT_THROW(ndl::HeapText::create(heap, true, std::string(64, 'b')), ndl::ResourceExhaustedError);
    ndl::release(heap, a);
    EXPECT_EQ(heap.stats().peak_word_count, 10u);
}

TEST(HeapTests, CheckedRejectsUnknownAddresses) {
    ndl::Heap constants;
    ndl::OBJECT c = ndl::HeapText::create(constants, false, "constant").to_object();
    ndl::Heap heap{0, &constants};
    EXPECT_TRUE(heap.contains(c.as_ptr()));
    EXPECT_FALSE(heap.owns(c.as_ptr()));
    EXPECT_EQ(heap.checked(c).kind(), ndl::HeapKind::Text);

    alignas(8) ndl::Word stray[4] = {0x2, 0, 0, 0};
    EXPECT_THROW(heap.checked(ndl::OBJECT::make_ptr(stray)), ndl::FatalError);
    EXPECT_THROW(heap.checked(ndl::OBJECT::make_int(1)), ndl::FatalError);
}
