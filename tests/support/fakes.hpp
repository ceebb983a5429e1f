#pragma once

#include <opencv2/core.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/image/compositor.hpp"
#include "internal/image/image_codec.hpp"
#include "internal/net/fetcher.hpp"
#include "internal/net/resolver.hpp"
#include "internal/util/errors.hpp"

namespace framecomp::testing {

// Encoded solid-colour image. colour is BGR.
inline std::string SolidImage(int width, int height, cv::Scalar colour, framecomp::v1::ImageFormat format = framecomp::v1::IMAGE_FORMAT_PNG) {
  cv::Mat pixels(height, width, CV_8UC3, colour);
  return image::Encode(pixels, format, 95);
}

struct FeedItem {
  std::string id;
  std::string image_link;
};

// Atom feed with g:id / g:image_link children, as merchant feeds carry them.
inline std::string AtomFeed(const std::vector<FeedItem>& items) {
  std::string xml =
      "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
      "<feed xmlns=\"http://www.w3.org/2005/Atom\" xmlns:g=\"http://base.google.com/ns/1.0\">\n"
      "  <title>catalog</title>\n";
  for (const auto& item : items) {
    xml += "  <entry>\n";
    if (!item.id.empty()) xml += "    <g:id>" + item.id + "</g:id>\n";
    xml += "    <title>product " + item.id + "</title>\n";
    if (!item.image_link.empty()) xml += "    <g:image_link>" + item.image_link + "</g:image_link>\n";
    xml += "  </entry>\n";
  }
  xml += "</feed>\n";
  return xml;
}

/*
  Resolver with canned answers. A host with several queued answers
  returns them in turn and then keeps repeating the last one.
*/
class FakeResolver final : public net::Resolver {
 public:
  void Set(const std::string& host, std::vector<std::string> addresses) {
    std::lock_guard lock(mutex_);
    answers_[host] = {std::move(addresses)};
  }

  void Queue(const std::string& host, std::vector<std::string> addresses) {
    std::lock_guard lock(mutex_);
    answers_[host].push_back(std::move(addresses));
  }

  std::vector<net::IpAddress> Resolve(const std::string& host) override {
    std::lock_guard lock(mutex_);
    ++calls_;
    auto it = answers_.find(host);
    if (it == answers_.end() || it->second.empty()) {
      throw util::ValidationError("host does not resolve: " + host);
    }

    auto answer = it->second.front();
    if (it->second.size() > 1) it->second.pop_front();

    std::vector<net::IpAddress> out;
    for (const auto& text : answer) {
      auto address = net::ParseIpLiteral(text);
      if (address) out.push_back(*address);
    }
    return out;
  }

  int Calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
  }

 private:
  mutable std::mutex                                             mutex_;
  std::map<std::string, std::deque<std::vector<std::string>>> answers_;
  int                                                            calls_ = 0;
};

/*
  In-memory fetcher keyed by URL. Unknown URLs fail like an unreachable
  host. Thread-safe; counts calls per URL.
*/
class FakeFetcher final : public net::Fetcher {
 public:
  enum class Failure { kNone, kFetch, kValidation };

  void Serve(const std::string& url, std::string body, std::string content_type = "") {
    std::lock_guard lock(mutex_);
    routes_[url] = Route{std::move(body), std::move(content_type), Failure::kNone};
  }

  void Fail(const std::string& url, Failure failure) {
    std::lock_guard lock(mutex_);
    routes_[url] = Route{"", "", failure};
  }

  void SetDelay(std::chrono::milliseconds delay) {
    delay_ = delay;
  }

  net::FetchResponse Fetch(const std::string& url, net::ContentKind) override {
    Route route;
    {
      std::lock_guard lock(mutex_);
      ++calls_[url];
      auto it = routes_.find(url);
      if (it == routes_.end()) {
        route.failure = Failure::kFetch;
      } else {
        route = it->second;
      }
    }

    if (delay_.count() > 0) std::this_thread::sleep_for(delay_);

    switch (route.failure) {
      case Failure::kFetch:
        throw util::FetchError("could not connect to " + url);
      case Failure::kValidation:
        throw util::ValidationError("URL rejected: " + url);
      case Failure::kNone:
        break;
    }
    return net::FetchResponse{route.body, route.content_type, url};
  }

  int Calls(const std::string& url) const {
    std::lock_guard lock(mutex_);
    auto            it = calls_.find(url);
    return it == calls_.end() ? 0 : it->second;
  }

  int TotalCalls() const {
    std::lock_guard lock(mutex_);
    int             total = 0;
    for (const auto& [_, n] : calls_) total += n;
    return total;
  }

 private:
  struct Route {
    std::string body;
    std::string content_type;
    Failure     failure = Failure::kNone;
  };

  mutable std::mutex           mutex_;
  std::map<std::string, Route> routes_;
  std::map<std::string, int>   calls_;
  std::chrono::milliseconds    delay_{0};
};

/*
  Wraps the real compositor and records how many composites ran at once.
  When gated, every composite blocks until Open() is called.
*/
class ProbeCompositor final : public image::Compositor {
 public:
  explicit ProbeCompositor(image::CompositorOptions options = {}, std::chrono::milliseconds hold = std::chrono::milliseconds{0})
      : inner_(options), hold_(hold) {
  }

  cv::Mat Composite(const image::FrameTemplate& frame, const image::OverlayRect& rect, std::string_view product_bytes) const override {
    const int now = ++active_;
    int       seen = peak_.load();
    while (now > seen && !peak_.compare_exchange_weak(seen, now)) {
    }
    ++calls_;

    {
      std::unique_lock lock(gate_mutex_);
      ++waiting_;
      gate_cv_.notify_all();
      gate_cv_.wait(lock, [&] { return open_; });
      --waiting_;
    }
    if (hold_.count() > 0) std::this_thread::sleep_for(hold_);

    struct Leave {
      std::atomic<int>& active;
      ~Leave() {
        --active;
      }
    } leave{active_};
    return inner_.Composite(frame, rect, product_bytes);
  }

  int OutputQuality() const override {
    return inner_.OutputQuality();
  }

  void Close() {
    std::lock_guard lock(gate_mutex_);
    open_ = false;
  }

  void Open() {
    {
      std::lock_guard lock(gate_mutex_);
      open_ = true;
    }
    gate_cv_.notify_all();
  }

  // Blocks until n composites are parked at the closed gate.
  void WaitForWaiting(int n) const {
    std::unique_lock lock(gate_mutex_);
    gate_cv_.wait(lock, [&] { return waiting_ >= n; });
  }

  int Peak() const {
    return peak_.load();
  }

  int Calls() const {
    return calls_.load();
  }

 private:
  image::OpenCvCompositor   inner_;
  std::chrono::milliseconds hold_;

  mutable std::atomic<int> active_{0};
  mutable std::atomic<int> peak_{0};
  mutable std::atomic<int> calls_{0};

  mutable std::mutex              gate_mutex_;
  mutable std::condition_variable gate_cv_;
  bool                            open_    = true;
  mutable int                     waiting_ = 0;
};

} // namespace framecomp::testing
