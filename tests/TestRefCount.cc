#include <gtest/gtest.h>

#include "ndl-core/feedback.hh"
#include "ndl-core/heap.hh"
#include "ndl-core/refcount.hh"

///
/// REFERENCE COUNT TESTS
/// - every test ends with the heap empty: balanced retains and releases free everything exactly once
///

TEST(RefCountTests, RetainAndReleaseBalance) {
    ndl::Heap heap;
    ndl::OBJECT text = ndl::HeapText::create(heap, true, "shared").to_object();
    ndl::retain(heap, text);
    ndl::retain(heap, text, 3);
    EXPECT_EQ(ndl::HeapObject(text.as_ptr()).refcount(), 5u);
    for (int i = 0; i < 4; i++) {
        ndl::release(heap, text);
    }
    EXPECT_EQ(heap.stats().live_object_count, 1u);
    ndl::release(heap, text);
    EXPECT_EQ(heap.stats().live_object_count, 0u);
    EXPECT_EQ(heap.stats().deallocation_count, 1u);
}

TEST(RefCountTests, InlineValuesAreIgnored) {
    ndl::Heap heap;
    ndl::retain(heap, ndl::OBJECT::make_int(3));
    ndl::release(heap, ndl::OBJECT::make_symbol(ndl::sym::True));
    ndl::release(heap, ndl::OBJECT::make_builtin(0));
    ndl::release(heap, ndl::OBJECT::make_handle(1, 1));
    EXPECT_EQ(heap.stats().allocation_count, 0u);
    EXPECT_THROW(ndl::release(heap, ndl::OBJECT{0x7}), ndl::FatalError);
}

TEST(RefCountTests, UncountedObjectsAreIgnored) {
    ndl::Heap heap;
    ndl::OBJECT constant = ndl::HeapText::create(heap, false, "constant").to_object();
    ndl::retain(heap, constant);
    ndl::release(heap, constant);
    ndl::release(heap, constant);
    EXPECT_EQ(heap.stats().live_object_count, 1u);
}

TEST(RefCountTests, ReleasingAContainerReleasesChildren) {
    ndl::Heap heap;
    ndl::OBJECT a = ndl::HeapText::create(heap, true, "a").to_object();
    ndl::OBJECT b = ndl::HeapText::create(heap, true, "b").to_object();
    ndl::retain(heap, a);
    ndl::OBJECT list = ndl::HeapList::create(heap, true, {a, b}).to_object();
    ndl::OBJECT tag = ndl::HeapTag::create(heap, true, ndl::sym::Ok, list).to_object();
    ndl::OBJECT fn = ndl::HeapFunction::create(heap, true, 0, 0, {tag}).to_object();
    EXPECT_EQ(heap.stats().live_object_count, 5u);

    ndl::release(heap, fn);
    // `a` is still referenced from the outside
    EXPECT_EQ(heap.stats().live_object_count, 1u);
    EXPECT_EQ(ndl::HeapText(a.as_ptr()).text(), "a");
    ndl::release(heap, a);
    EXPECT_EQ(heap.stats().live_object_count, 0u);
}

TEST(RefCountTests, SharedChildrenSurviveOneParent) {
    ndl::Heap heap;
    ndl::OBJECT child = ndl::HeapText::create(heap, true, "child").to_object();
    ndl::retain(heap, child);
    ndl::OBJECT p1 = ndl::HeapList::create(heap, true, {child}).to_object();
    ndl::OBJECT p2 = ndl::HeapList::create(heap, true, {child}).to_object();
    ndl::release(heap, p1);
    EXPECT_EQ(ndl::HeapObject(child.as_ptr()).refcount(), 1u);
    ndl::release(heap, p2);
    EXPECT_EQ(heap.stats().live_object_count, 0u);
}

TEST(RefCountTests, StructReleasesKeysAndValues) {
    ndl::Heap heap;
    ndl::OBJECT k1 = ndl::HeapText::create(heap, true, "k").to_object();
    ndl::OBJECT v1 = ndl::HeapText::create(heap, true, "first").to_object();
    ndl::OBJECT k2 = ndl::HeapText::create(heap, true, "k").to_object();
    ndl::OBJECT v2 = ndl::HeapText::create(heap, true, "second").to_object();
    ndl::OBJECT record = ndl::HeapStruct::create(heap, true, {{k1, v1}, {k2, v2}}).to_object();
    // the overwritten field is released on construction
    EXPECT_EQ(heap.stats().live_object_count, 3u);
    ndl::release(heap, record);
    EXPECT_EQ(heap.stats().live_object_count, 0u);
}

TEST(RefCountTests, DeepListsDoNotOverflowTheNativeStack) {
    ndl::Heap heap;
    ndl::OBJECT chain = ndl::HeapList::create(heap, true, {}).to_object();
    for (int i = 0; i < 200000; i++) {
        chain = ndl::HeapList::create(heap, true, {ndl::OBJECT::make_int(i), chain}).to_object();
    }
    EXPECT_EQ(heap.stats().live_object_count, 200001u);
    ndl::release(heap, chain);
    EXPECT_EQ(heap.stats().live_object_count, 0u);
}

TEST(RefCountTests, ReleasingAFreedObjectIsFatal) {
    ndl::Heap heap;
    ndl::OBJECT text = ndl::HeapText::create(heap, true, "gone").to_object();
    ndl::release(heap, text);
    EXPECT_THROW(ndl::release(heap, text), ndl::FatalError);
    EXPECT_THROW(ndl::retain(heap, text), ndl::FatalError);
}
