// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <future>

#include "common/helper.inl"

namespace npbindtest {

constexpr npbind::capability_id_t sequencer_cap_id = 200;

static const npbind::Capability& sequencer_cap()
{
    using npbind::ValueType;
    static const npbind::Capability& cap = npbind::Catalogue::instance().add(
        npbind::Capability(sequencer_cap_id, "test.Sequencer")
            .method("Next", {ValueType::Int64}, {ValueType::Int64})
            .method("Fail", {ValueType::String})
            .method("Wrong", {}, {ValueType::Int64})
            .method("Slow", {}));
    return cap;
}

// Checks call order and concurrency of the calls it receives
class Sequencer : public npbind::HostObject
{
    std::atomic<std::int64_t> next_{0};
    std::atomic<int> active_{0};
    std::atomic<int> max_active_{0};

public:
    explicit Sequencer(
        npbind::DispatchPolicy policy = npbind::DispatchPolicy::Concurrent)
        : npbind::HostObject(policy)
    {
    }

    int max_active() const noexcept { return max_active_.load(); }

    npbind::CapabilitySet capabilities() const override
    {
        return {&sequencer_cap()};
    }

    void dispatch(const npbind::Capability&,
                  const npbind::MethodInfo& method,
                  npbind::Args& args,
                  npbind::Args& results) override
    {
        switch (method.index) {
        case 0: {
            auto expected = npbind::value_as<std::int64_t>(args, 0);
            auto current = next_.load();
            if (expected != current)
                throw std::runtime_error("out of order: expected " +
                                         std::to_string(current) + ", got " +
                                         std::to_string(expected));
            next_.store(current + 1);
            results.emplace_back(current);
            break;
        }
        case 1:
            throw std::runtime_error(npbind::value_as<std::string>(args, 0));
        case 2:
            results.emplace_back("not a number"s);
            break;
        case 3: {
            auto n = ++active_;
            auto prev = max_active_.load();
            while (prev < n && !max_active_.compare_exchange_weak(prev, n))
                ;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --active_;
            break;
        }
        default:
            throw npbind::ExceptionNoSuchMethod(method.name);
        }
    }
};

static std::shared_ptr<ForeignObject> foreign_i2()
{
    auto obj = std::make_shared<ForeignObject>();
    obj->on(testpkg::I2_cap().get("Times"), [](FValues& args) {
        return FValues{std::int64_t{fget<std::int32_t>(args, 0)} * 10};
    });
    obj->on(testpkg::I2_cap().get("Error"), [](FValues& args) -> FValues {
        if (fget<bool>(args, 0))
            throw ForeignFailure("foreign side failed");
        return {no_ferror};
    });
    // wrong result type
    obj->on(testpkg::I2_cap().get("StringError"), [](FValues&) {
        return FValues{std::int32_t{1}};
    });
    return obj;
}

// Host to foreign

TEST_F(NpbindTest, InvokeForeign)
{
    auto fh = foreign->add_object(foreign_i2());
    try {
        auto out = bridge->invoke_foreign(fh, testpkg::I2_cap(), "Times",
                                          {std::int32_t{7}});
        ASSERT_EQ(out.size(), 1u);
        EXPECT_EQ(npbind::value_as<std::int64_t>(out, 0), 70);
    } catch (npbind::Exception& ex) {
        FAIL() << "Exception: " << ex.what();
    }
    foreign->forget(fh);
}

TEST_F(NpbindTest, InvokeForeignFailures)
{
    auto fh = foreign->add_object(foreign_i2());

    try {
        bridge->invoke_foreign(fh, testpkg::I2_cap(), "Error", {true});
        FAIL() << "expected ForeignException";
    } catch (npbind::ForeignException& ex) {
        EXPECT_EQ(ex.error().message(), "foreign side failed");
    }

    // no handler registered for VarUpdate on this object
    EXPECT_THROW(
        bridge->invoke_foreign(fh, testpkg::GoCallback_cap(), "VarUpdate", {}),
        npbind::ExceptionNoSuchMethod);

    // not a method of the capability: rejected before sending
    auto calls = foreign->calls();
    EXPECT_THROW(bridge->invoke_foreign(fh, testpkg::I2_cap(), "Nope", {}),
                 npbind::ExceptionNoSuchMethod);
    EXPECT_THROW(
        bridge->invoke_foreign(fh, testpkg::I2_cap(), "Times", {"seven"s}),
        npbind::ExceptionBadInput);
    EXPECT_EQ(foreign->calls(), calls);

    EXPECT_THROW(
        bridge->invoke_foreign(fh, testpkg::I2_cap(), "StringError", {"x"s}),
        npbind::ExceptionBadInput);

    foreign->forget(fh);
    EXPECT_THROW(bridge->invoke_foreign(fh, testpkg::I2_cap(), "Times",
                                        {std::int32_t{1}}),
                 npbind::ExceptionStaleHandle);
    EXPECT_THROW(bridge->invoke_foreign(npbind::null_handle, testpkg::I2_cap(),
                                        "Times", {std::int32_t{1}}),
                 npbind::ExceptionBadInput);
}

TEST_F(NpbindTest, InvokeForeignTimeout)
{
    auto obj = std::make_shared<ForeignObject>();
    std::atomic<int> finished{0};
    obj->on(testpkg::GoCallback_cap().get("VarUpdate"), [&](FValues&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        ++finished;
        return FValues{};
    });
    auto fh = foreign->add_object(obj);

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(bridge->invoke_foreign(fh, testpkg::GoCallback_cap(),
                                        "VarUpdate", {},
                                        std::chrono::milliseconds(50)),
                 npbind::ExceptionTimeout);
    EXPECT_LT(std::chrono::steady_clock::now() - start,
              std::chrono::milliseconds(250));

    // the late reply is dropped, the next call is unaffected
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    EXPECT_EQ(finished.load(), 1);
    EXPECT_NO_THROW(bridge->invoke_foreign(fh, testpkg::GoCallback_cap(),
                                           "VarUpdate", {},
                                           std::chrono::seconds(5)));
    EXPECT_EQ(finished.load(), 2);
    foreign->forget(fh);
}

TEST_F(NpbindTest, ProxyTimeout)
{
    auto obj = std::make_shared<ForeignObject>();
    obj->on(testpkg::I2_cap().get("Times"), [](FValues&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return FValues{std::int64_t{0}};
    });
    auto fh = foreign->add_object(obj);

    foreign->pass(fh);
    auto proxy = bridge->wrap_foreign_as_proxy(fh, testpkg::I2_cap());
    proxy->set_timeout(std::chrono::milliseconds(20));
    EXPECT_THROW(npbind::narrow<testpkg::I2>(proxy)->Times(1),
                 npbind::ExceptionTimeout);

    proxy.reset();
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(foreign->refs(fh), 0);
    foreign->forget(fh);
}

// Foreign to host

TEST_F(NpbindTest, OrderedCallsFromForeignThread)
{
    constexpr std::int64_t calls_n = 100000;

    auto seq = std::make_shared<Sequencer>();
    auto h = bridge->expose_to_foreign(seq).value();
    auto selector = sequencer_cap().get("Next").selector;

    std::promise<std::string> done;
    foreign->run([&] {
        try {
            for (std::int64_t i = 0; i < calls_n; ++i) {
                auto out = foreign->call(h, selector, {i});
                if (fget<std::int64_t>(out, 0) != i)
                    throw std::runtime_error("unexpected result at " +
                                             std::to_string(i));
            }
            done.set_value({});
        } catch (std::exception& ex) {
            done.set_value(ex.what());
        }
    });

    auto result = done.get_future();
    ASSERT_EQ(result.wait_for(std::chrono::seconds(120)),
              std::future_status::ready);
    EXPECT_EQ(result.get(), "");

    bridge->release(h);
}

TEST_F(NpbindTest, HostFaultBecomesExceptionReply)
{
    auto seq = std::make_shared<Sequencer>();
    auto h = bridge->expose_to_foreign(seq).value();

    auto reply = foreign->call_host(h, "test.Sequencer.Fail"s, {"kaboom"s});
    EXPECT_EQ(reply.id, npbind::MessageId::Exception);
    EXPECT_EQ(reply.message, "kaboom");

    // results that do not match the declaration are a host fault as well
    reply = foreign->call_host(h, "test.Sequencer.Wrong"s, {});
    EXPECT_EQ(reply.id, npbind::MessageId::Exception);

    // the object keeps working
    reply = foreign->call_host(h, "test.Sequencer.Next"s, {std::int64_t{0}});
    EXPECT_TRUE(reply.ok());

    bridge->release(h);
}

TEST_F(NpbindTest, InvokeHostErrors)
{
    auto seq = std::make_shared<Sequencer>();
    auto h = bridge->expose_to_foreign(seq).value();

    // capability not recorded for the handle
    auto reply = foreign->call_host(h, testpkg::I2_cap().get("Times").selector,
                                    {std::int32_t{1}});
    EXPECT_EQ(reply.id, npbind::MessageId::Error_NoSuchMethod);

    reply = foreign->call_host(h, npbind::make_selector(sequencer_cap_id, 99),
                               {});
    EXPECT_EQ(reply.id, npbind::MessageId::Error_NoSuchMethod);

    reply = foreign->call_host(h, "test.Sequencer.Nope"s, {});
    EXPECT_EQ(reply.id, npbind::MessageId::Error_NoSuchMethod);

    reply = foreign->call_host(h, "NoDots"s, {});
    EXPECT_EQ(reply.id, npbind::MessageId::Error_NoSuchMethod);

    // argument count and type
    reply = foreign->call_host(h, "test.Sequencer.Next"s, {});
    EXPECT_EQ(reply.id, npbind::MessageId::Error_BadInput);

    reply = foreign->call_host(h, "test.Sequencer.Next"s, {std::int32_t{0}});
    EXPECT_EQ(reply.id, npbind::MessageId::Error_BadInput);

    bridge->release(h);

    reply = foreign->call_host(h, "test.Sequencer.Next"s, {std::int64_t{0}});
    EXPECT_EQ(reply.id, npbind::MessageId::Error_StaleHandle);
}

TEST_F(NpbindTest, SerializedPolicy)
{
    auto serialized =
        std::make_shared<Sequencer>(npbind::DispatchPolicy::Serialized);
    auto h = bridge->expose_to_foreign(serialized).value();

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 10; ++i)
                foreign->call(h, "test.Sequencer.Slow"s);
        });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(serialized->max_active(), 1);
    bridge->release(h);
}

TEST_F(NpbindTest, ThreadAttachment)
{
    std::thread([] {
        auto before = bridge->stats().attached_threads;
        {
            npbind::ThreadAttachment outer(*bridge);
            EXPECT_TRUE(outer.owns());
            EXPECT_EQ(bridge->stats().attached_threads, before + 1);
            {
                npbind::ThreadAttachment inner(*bridge);
                EXPECT_FALSE(inner.owns());
            }
            EXPECT_EQ(bridge->stats().attached_threads, before + 1);
        }
        EXPECT_EQ(bridge->stats().attached_threads, before);
    }).join();

    // attached on the first call, detached when the thread exits
    auto before = bridge->stats().attached_threads;
    std::thread([before] {
        auto seq = std::make_shared<Sequencer>();
        auto h = bridge->expose_to_foreign(seq).value();
        EXPECT_TRUE(foreign->call_host(h, "test.Sequencer.Slow"s, {}).ok());
        EXPECT_EQ(bridge->stats().attached_threads, before + 1);
        bridge->release(h);
    }).join();
    EXPECT_EQ(bridge->stats().attached_threads, before);
}

} // namespace npbindtest

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);

    // Register the test environment
    ::testing::AddGlobalTestEnvironment(new npbindtest::NpbindTestEnvironment);

    return RUN_ALL_TESTS();
}
