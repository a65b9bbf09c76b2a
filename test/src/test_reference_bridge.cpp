// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <npbind/impl/bridge_impl.hpp>

#include "common/helper.inl"

namespace npbindtest {

static npbind::impl::BridgeImpl& bridge_impl()
{
    return *static_cast<npbind::impl::BridgeImpl*>(bridge);
}

static std::shared_ptr<ForeignObject> foreign_i2()
{
    auto obj = std::make_shared<ForeignObject>();
    obj->on(testpkg::I2_cap().get("Times"), [](FValues& args) {
        return FValues{std::int64_t{fget<std::int32_t>(args, 0)} * 2};
    });
    return obj;
}

TEST_F(NpbindTest, ExposeReturnsLiveHandle)
{
    auto obj = std::make_shared<testpkg::Concrete>();

    auto h1 = bridge->expose_to_foreign(obj);
    auto h2 = bridge->expose_to_foreign(obj);
    EXPECT_EQ(h1, h2);
    EXPECT_EQ(obj->exported_handle(), h1.value());
    EXPECT_EQ(bridge->resolve(h1.value()), obj);

    EXPECT_EQ(bridge->release(h1.value()), npbind::ReleaseResult::Released);
    EXPECT_EQ(bridge->release(h1.value()), npbind::ReleaseResult::StaleHandle);
    EXPECT_THROW(bridge->resolve(h1.value()), npbind::ExceptionStaleHandle);

    // exposed again after release: a new handle
    auto h3 = bridge->expose_to_foreign(obj);
    EXPECT_NE(h3, h1);
    bridge->release(h3.value());
}

TEST_F(NpbindTest, ConcurrentExposeYieldsOneHandle)
{
    auto obj = std::make_shared<testpkg::Concrete>();
    auto live_before = bridge->stats().live_handles;

    std::vector<std::thread> threads;
    std::vector<npbind::Handle> handles(8);
    for (std::size_t i = 0; i < handles.size(); ++i) {
        threads.emplace_back(
            [&, i] { handles[i] = bridge->expose_to_foreign(obj); });
    }
    for (auto& t : threads)
        t.join();

    for (auto& h : handles)
        EXPECT_EQ(h, handles[0]);
    EXPECT_EQ(bridge->stats().live_handles, live_before + 1);

    bridge->release(handles[0].value());
}

TEST_F(NpbindTest, ExposeChecksCapabilities)
{
    auto obj = std::make_shared<testpkg::Concrete>();

    EXPECT_THROW(bridge->expose_to_foreign(obj, {&testpkg::I2_cap()}),
                 npbind::Exception);
    EXPECT_THROW(bridge->expose_to_foreign(nullptr), npbind::Exception);

    // recorded capabilities restrict what the foreign side may call
    auto h = bridge->expose_to_foreign(obj, {&testpkg::Concrete_cap()});
    auto reply = foreign->call_host(h.value(), "testpkg.Interface.F"s, {});
    EXPECT_EQ(reply.id, npbind::MessageId::Error_NoSuchMethod);

    reply = foreign->call_host(h.value(), "testpkg.Concrete.F"s, {});
    EXPECT_TRUE(reply.ok());

    bridge->release(h.value());
}

TEST_F(NpbindTest, PinIsNeverDeduplicated)
{
    auto obj = std::make_shared<testpkg::Concrete>();

    auto exposed = bridge->expose_to_foreign(obj);
    auto pinned = bridge->pin(obj);
    EXPECT_NE(exposed, pinned);

    bridge->release(exposed.value());
    EXPECT_EQ(bridge->resolve(pinned.value()), obj);
    bridge->release(pinned.value());
}

TEST_F(NpbindTest, IdentityPreservingProxy)
{
    auto fh = foreign->add_object(foreign_i2());
    auto releases = foreign->releases();

    foreign->pass(fh);
    auto p1 = bridge->wrap_foreign<testpkg::I2>(fh, testpkg::I2_cap());
    foreign->pass(fh);
    auto p2 = bridge->wrap_foreign<testpkg::I2>(fh, testpkg::I2_cap());

    ASSERT_NE(p1, nullptr);
    EXPECT_EQ(p1, p2);
    // the second reference was dropped at once
    EXPECT_EQ(foreign->refs(fh), 1);
    EXPECT_EQ(foreign->releases(), releases + 1);

    EXPECT_EQ(p1->Times(21), 42);

    p1.reset();
    EXPECT_EQ(foreign->refs(fh), 1);
    p2.reset();
    EXPECT_EQ(foreign->refs(fh), 0);
    EXPECT_EQ(foreign->releases(), releases + 2);

    // a new proxy once the old one is gone
    foreign->pass(fh);
    auto p3 = bridge->wrap_foreign<testpkg::I2>(fh, testpkg::I2_cap());
    EXPECT_EQ(p3->Times(1), 2);
    p3.reset();
    EXPECT_EQ(foreign->refs(fh), 0);
    foreign->forget(fh);
}

TEST_F(NpbindTest, PlainProxiesAreDistinct)
{
    auto obj = std::make_shared<ForeignObject>();
    std::vector<std::string> heard;
    std::mutex mut;
    obj->on(testpkg::Receiver_cap().get("Hello"), [&](FValues& args) {
        std::lock_guard<std::mutex> lk(mut);
        heard.push_back(fget<std::string>(args, 0));
        return FValues{};
    });
    auto fh = foreign->add_object(obj);

    foreign->pass(fh);
    foreign->pass(fh);
    auto& cap = testpkg::Receiver_cap();
    auto r1 = bridge->wrap_foreign<testpkg::Receiver>(fh, cap);
    auto r2 = bridge->wrap_foreign<testpkg::Receiver>(fh, cap);

    EXPECT_NE(r1, r2);
    EXPECT_EQ(foreign->refs(fh), 2);

    r1->Hello("one");
    r2->Hello("two");
    EXPECT_EQ(heard, (std::vector<std::string>{"one", "two"}));

    r1.reset();
    r2.reset();
    EXPECT_EQ(foreign->refs(fh), 0);
    foreign->forget(fh);
}

TEST_F(NpbindTest, NullForeignHandleWrapsToNull)
{
    EXPECT_EQ(bridge->wrap_foreign_as_proxy(npbind::null_handle,
                                            testpkg::I2_cap()),
              nullptr);
}

TEST_F(NpbindTest, ForeignReferenceReturnsUnwrapped)
{
    auto fh = foreign->add_object(foreign_i2());

    auto out = call_package("I2Dup", {foreign->pass(fh)});
    EXPECT_EQ(fget<npbind::WireRef>(out, 0), npbind::WireRef::foreign(fh));
    // the proxy built for the call is gone
    EXPECT_EQ(foreign->refs(fh), 0);
    foreign->forget(fh);
}

TEST_F(NpbindTest, HostReferenceRoundTrip)
{
    auto obj = std::make_shared<testpkg::I2_Servant>();
    auto h = bridge->expose_to_foreign(obj).value();

    auto out = call_package("I2Dup", {npbind::WireRef::host(h)});
    EXPECT_EQ(fget<npbind::WireRef>(out, 0), npbind::WireRef::host(h));

    bridge->release(h);
}

TEST_F(NpbindTest, NullReferenceRoundTrip)
{
    auto live = bridge->stats().live_handles;
    auto out = call_package("I2Dup", {npbind::WireRef{}});
    EXPECT_TRUE(fget<npbind::WireRef>(out, 0).is_null());
    EXPECT_EQ(bridge->stats().live_handles, live);
}

TEST_F(NpbindTest, HostReferenceOfWrongCapability)
{
    auto obj = std::make_shared<testpkg::Concrete>();
    auto h = bridge->expose_to_foreign(obj).value();

    auto reply = try_call_package("CallIError", {npbind::WireRef::host(h), true});
    EXPECT_EQ(reply.id, npbind::MessageId::Error_BadInput);

    bridge->release(h);
}

TEST_F(NpbindTest, StaleHostReference)
{
    auto obj = std::make_shared<testpkg::Concrete>();
    auto h = bridge->expose_to_foreign(obj).value();
    bridge->release(h);

    auto reply = try_call_package("I2Dup", {npbind::WireRef::host(h)});
    EXPECT_EQ(reply.id, npbind::MessageId::Error_StaleHandle);
}

TEST_F(NpbindTest, UntypedForeignReferenceIsReleased)
{
    auto fh = foreign->add_object(foreign_i2());
    foreign->pass(fh);

    EXPECT_THROW(bridge_impl().references().decode(npbind::WireRef::foreign(fh),
                                                   npbind::Param::object()),
                 npbind::ExceptionBadInput);
    EXPECT_EQ(foreign->refs(fh), 0);

    foreign->pass(fh);
    EXPECT_THROW(bridge_impl().references().decode(
                     npbind::WireRef::foreign(fh),
                     npbind::Param::object(0xFFF0)),
                 npbind::ExceptionBadInput);
    EXPECT_EQ(foreign->refs(fh), 0);
    foreign->forget(fh);
}

TEST_F(NpbindTest, MarshalChecksValues)
{
    auto& refs = bridge_impl().references();
    npbind::flat_buffer buf;
    npbind::WireWriter w(buf, npbind::MessageId::Success,
                         npbind::MessageType::Answer);
    w.begin_values();

    EXPECT_THROW(refs.marshal(w, {std::int32_t{1}}, {npbind::ValueType::Int64}),
                 npbind::ExceptionBadInput);
    EXPECT_THROW(refs.marshal(w, {}, {npbind::ValueType::Int64}),
                 npbind::ExceptionBadInput);

    // object lacking the declared capability
    npbind::ObjectRef concrete = std::make_shared<testpkg::Concrete>();
    EXPECT_THROW(
        refs.marshal(w, {concrete}, {npbind::Param::object(testpkg::cap_id::I2)}),
        npbind::ExceptionBadInput);
}

TEST_F(NpbindTest, ProxyCount)
{
    auto fh = foreign->add_object(foreign_i2());
    auto before = bridge->stats().live_proxies;

    foreign->pass(fh);
    auto p = bridge->wrap_foreign_as_proxy(fh, testpkg::I2_cap());
    EXPECT_EQ(bridge->stats().live_proxies, before + 1);

    p.reset();
    EXPECT_EQ(bridge->stats().live_proxies, before);
    foreign->forget(fh);
}

// Foreign references that arrive in a rejected message are not leaked

TEST_F(NpbindTest, RejectedArgumentsReleaseLaterReferences)
{
    auto obj = std::make_shared<testpkg::Concrete>();
    auto stale = bridge->expose_to_foreign(obj).value();
    bridge->release(stale);

    auto fh = foreign->add_object(std::make_shared<ForeignObject>());
    auto reply = try_call_package(
        "CallWithNull", {npbind::WireRef::host(stale), foreign->pass(fh)});
    EXPECT_EQ(reply.id, npbind::MessageId::Error_StaleHandle);
    EXPECT_EQ(foreign->refs(fh), 0);

    // second argument of the wrong type
    reply = try_call_package("Hello", {"x"s, foreign->pass(fh)});
    EXPECT_EQ(reply.id, npbind::MessageId::Error_BadInput);
    EXPECT_EQ(foreign->refs(fh), 0);

    // more values than parameters
    reply = try_call_package("I2Dup", {foreign->pass(fh), foreign->pass(fh)});
    EXPECT_EQ(reply.id, npbind::MessageId::Error_BadInput);
    EXPECT_EQ(foreign->refs(fh), 0);

    // malformed value after the reference
    reply = try_call_package("CallIError", {foreign->pass(fh), std::int32_t{1}});
    EXPECT_EQ(reply.id, npbind::MessageId::Error_BadInput);
    EXPECT_EQ(foreign->refs(fh), 0);

    foreign->forget(fh);
}

TEST_F(NpbindTest, UndeliveredCallReleasesReferences)
{
    auto fh = foreign->add_object(std::make_shared<ForeignObject>());

    auto obj = std::make_shared<testpkg::Concrete>();
    auto stale = bridge->expose_to_foreign(obj).value();
    bridge->release(stale);

    auto reply = foreign->call_host(stale, "testpkg.Package.I2Dup"s,
                                    {foreign->pass(fh)});
    EXPECT_EQ(reply.id, npbind::MessageId::Error_StaleHandle);
    EXPECT_EQ(foreign->refs(fh), 0);

    reply = try_call_package("NoSuchFunction", {foreign->pass(fh)});
    EXPECT_EQ(reply.id, npbind::MessageId::Error_NoSuchMethod);
    EXPECT_EQ(foreign->refs(fh), 0);

    foreign->forget(fh);
}

TEST_F(NpbindTest, RejectedReplyReleasesReferences)
{
    auto extra = foreign->add_object(std::make_shared<ForeignObject>());

    auto obj = std::make_shared<ForeignObject>();
    std::atomic<int> mode{0};
    obj->on(testpkg::I2_cap().get("Times"), [&](FValues&) {
        if (mode == 0)
            return FValues{foreign->pass(extra), std::int64_t{1}};
        return FValues{foreign->pass(extra)};
    });
    auto fh = foreign->add_object(obj);

    // one value too many
    EXPECT_THROW(
        bridge->invoke_foreign(fh, testpkg::I2_cap(), "Times", {std::int32_t{2}}),
        npbind::ExceptionBadInput);
    EXPECT_EQ(foreign->refs(extra), 0);

    // a reference where an integer is expected
    mode = 1;
    EXPECT_THROW(
        bridge->invoke_foreign(fh, testpkg::I2_cap(), "Times", {std::int32_t{2}}),
        npbind::ExceptionBadInput);
    EXPECT_EQ(foreign->refs(extra), 0);

    foreign->forget(fh);
    foreign->forget(extra);
}

} // namespace npbindtest

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);

    // Register the test environment
    ::testing::AddGlobalTestEnvironment(new npbindtest::NpbindTestEnvironment);

    return RUN_ALL_TESTS();
}
