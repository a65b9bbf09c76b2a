// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <mutex>

#include <boost/asio/post.hpp>

#include <npbind/impl/bridge_impl.hpp>

#include "logging.hpp"

namespace npbind::impl {

namespace {
std::mutex g_bridge_mut;
std::shared_ptr<BridgeImpl> g_bridge;
} // namespace

NPBIND_API std::shared_ptr<BridgeImpl> current_bridge() noexcept
{
  std::lock_guard<std::mutex> lk(g_bridge_mut);
  return g_bridge;
}

BridgeImpl::BridgeImpl(BuildConfig cfg)
    : cfg_{std::move(cfg)}
    , work_guard_{boost::asio::make_work_guard(ioc_)}
    , collect_timer_{ioc_}
    , threads_{std::make_shared<ThreadRegistry>(cfg_.on_thread_attach,
                                                cfg_.on_thread_detach)}
    , table_{cfg_.max_handles}
    , monitor_{table_, cfg_.signal_queue_capacity, cfg_.overflow_policy}
    , refs_{table_, monitor_, cfg_.transport}
    , dispatcher_{table_, refs_, *threads_, cfg_.transport}
{
}

BridgeImpl::~BridgeImpl()
{
  stop_executor();
}

void BridgeImpl::start()
{
  refs_.set_owner(weak_from_this());

  pool_ = std::make_unique<boost::asio::thread_pool>(cfg_.worker_threads);
  for (std::size_t i = 0; i < cfg_.worker_threads; ++i)
    boost::asio::post(*pool_, [this] { ioc_.run(); });

  if (cfg_.collection_interval.count() > 0) {
    boost::asio::post(ioc_, [this] { schedule_collection(); });
    NPBIND_LOG_DEBUG("periodic collection every {} ms",
                     cfg_.collection_interval.count());
  }
}

void BridgeImpl::schedule_collection()
{
  collect_timer_.expires_after(cfg_.collection_interval);
  collect_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || destroyed_.load(std::memory_order_acquire))
      return;
    try {
      monitor_.collect();
    } catch (std::exception& ex) {
      NPBIND_LOG_ERROR("periodic collection failed: {}", ex.what());
    }
    schedule_collection();
  });
}

void BridgeImpl::stop_executor() noexcept
{
  work_guard_.reset();
  ioc_.stop();
  if (pool_) {
    pool_->join();
    pool_.reset();
  }
}

Handle BridgeImpl::expose_to_foreign(const ObjectRef& obj, CapabilitySet caps)
{
  return refs_.expose_to_foreign(obj, caps);
}

Handle BridgeImpl::pin(const ObjectRef& obj)
{
  return refs_.pin(obj);
}

std::shared_ptr<ForeignProxy>
BridgeImpl::wrap_foreign_as_proxy(handle_t foreign_handle,
                                  const Capability& cap)
{
  return refs_.wrap_foreign_as_proxy(foreign_handle, cap);
}

Args BridgeImpl::invoke_foreign(
    handle_t foreign_handle,
    const Capability& cap,
    std::string_view method,
    Args args,
    std::optional<std::chrono::milliseconds> timeout)
{
  return dispatcher_.invoke_foreign(foreign_handle, cap, cap.get(method), args,
                                    timeout);
}

void BridgeImpl::invoke_host(handle_t handle,
                             selector_t selector,
                             const flat_buffer& args,
                             flat_buffer& reply) noexcept
{
  dispatcher_.invoke_host(handle, selector, args, reply);
}

void BridgeImpl::invoke_host(handle_t handle,
                             std::string_view selector,
                             const flat_buffer& args,
                             flat_buffer& reply) noexcept
{
  dispatcher_.invoke_host(handle, selector, args, reply);
}

ObjectRef BridgeImpl::resolve(handle_t handle) const
{
  return table_.resolve_object(Handle::from_value(handle));
}

ReleaseResult BridgeImpl::release(handle_t handle) noexcept
{
  return refs_.release(Handle::from_value(handle));
}

std::size_t BridgeImpl::collect()
{
  return monitor_.collect();
}

std::size_t BridgeImpl::drain_signals(std::size_t max,
                                      std::chrono::milliseconds timeout)
{
  return monitor_.drain_signals(max, timeout);
}

BridgeStats BridgeImpl::stats() const
{
  BridgeStats s;
  s.live_handles = table_.size();
  s.watched = monitor_.watched();
  s.pending_signals = monitor_.pending();
  s.dropped_signals = monitor_.dropped();
  s.live_proxies = refs_.proxy_count();
  s.attached_threads = threads_->attached_count();
  return s;
}

void BridgeImpl::destroy()
{
  if (destroyed_.exchange(true))
    return;

  // keeps this alive until the end of the function
  std::shared_ptr<BridgeImpl> self;
  {
    std::lock_guard<std::mutex> lk(g_bridge_mut);
    if (g_bridge.get() == this)
      self = std::move(g_bridge);
  }

  stop_executor();
  monitor_.shutdown();

  auto released = table_.clear();
  NPBIND_LOG_INFO("bridge destroyed, {} handles released", released);
}

} // namespace npbind::impl

namespace npbind {

NPBIND_API Bridge* get_bridge() noexcept
{
  return impl::current_bridge().get();
}

Bridge* BridgeBuilder::build()
{
  if (cfg_.max_handles == 0 || cfg_.max_handles > max_handles_limit)
    throw Exception("max_handles must be in [1, " +
                    std::to_string(max_handles_limit) + "]");
  if (cfg_.signal_queue_capacity == 0)
    throw Exception("signal queue capacity must be greater than zero");
  if (cfg_.worker_threads == 0)
    throw Exception("at least one worker thread is required");
  if (cfg_.collection_interval.count() < 0)
    throw Exception("collection interval must not be negative");

  std::lock_guard<std::mutex> lk(impl::g_bridge_mut);
  if (impl::g_bridge)
    throw Exception("npbind has been previously initialized");

  impl::get_logger()->set_level(cfg_.log_level);

  if (!cfg_.transport)
    NPBIND_LOG_INFO("no foreign transport, host to foreign calls disabled");

  auto bridge = std::make_shared<impl::BridgeImpl>(cfg_);
  bridge->start();
  impl::g_bridge = bridge;

  NPBIND_LOG_INFO("bridge initialized: max_handles={} signal_queue={}",
                  cfg_.max_handles, cfg_.signal_queue_capacity);
  return bridge.get();
}

} // namespace npbind
