#include "common.h"

#include <stdexcept>
#include <tuple>

static suite<"batching"> _ = [] {
  "batch_defers_notifications"_test = [] {
    auto a = signal{0};
    auto b = signal{0};

    auto a_calls = 0;
    auto b_calls = 0;
    std::ignore = a.subscribe([&] { ++a_calls; });
    std::ignore = b.subscribe([&] { ++b_calls; });

    batch([&] {
      a = 1;
      b = 2;
      expect(a_calls == 0_i) << "notifications should wait for the batch";
      expect(b_calls == 0_i);
      expect(rill::is_batching());
    });

    expect(a_calls == 1_i);
    expect(b_calls == 1_i);
    expect(not rill::is_batching());
  };

  "batch_deduplicates"_test = [] {
    auto a = signal{0};
    auto b = signal{0};

    auto calls = 0;
    auto subscriber =
        std::make_shared<const rill::subscriber_t>([&] { ++calls; });
    std::ignore = a.subscribe(subscriber);
    std::ignore = b.subscribe(subscriber);

    batch([&] {
      a = 1;
      a = 2;
      b = 3;
    });

    expect(calls == 1_i) << "a callback queued several times should run once";
  };

  "batch_recomputes_once"_test = [] {
    auto a = signal{1};
    auto b = signal{2};

    auto runs = 0;
    auto sum = computed{[=, &runs] {
      ++runs;
      return a() + b();
    }};

    auto seen = std::vector<int>{};
    std::ignore = sum.subscribe([&] { seen.push_back(sum()); });

    batch([&] {
      a = 10;
      b = 20;
    });

    expect(runs == 2_i);
    expect(seen == std::vector{30});
  };

  "nested_batches"_test = [] {
    auto a = signal{0};
    auto calls = 0;
    std::ignore = a.subscribe([&] { ++calls; });

    batch([&] {
      batch([&] { a = 1; });
      expect(calls == 0_i) << "only the outermost batch should flush";
      a = 2;
    });

    expect(calls == 1_i);
  };

  "batch_returns_result"_test = [] {
    auto a = signal{1};
    const auto result = batch([&] {
      a = 2;
      return a.peek() * 21;
    });

    expect(result == 42_i);
  };

  "reads_inside_batch"_test = [] {
    auto a = signal{1};
    auto doubled = computed{[=] { return a() * 2; }};

    batch([&] {
      a = 2;
      expect(doubled() == 4_i) << "reads inside a batch should see fresh "
                                  "values";
    });
  };

  "batch_throws_still_flushes"_test = [] {
    auto a = signal{0};
    auto calls = 0;
    std::ignore = a.subscribe([&] { ++calls; });

    expect(throws<std::runtime_error>([&] {
      batch([&] {
        a = 1;
        throw std::runtime_error{"boom"};
      });
    }));

    expect(calls == 1_i) << "pending notifications should still be delivered";
    expect(not rill::is_batching());
  };

  "callback_throws_during_flush"_test = [] {
    auto a = signal{0};
    auto b = signal{0};

    auto b_calls = 0;
    std::ignore = a.subscribe([] { throw std::runtime_error{"boom"}; });
    std::ignore = b.subscribe([&] { ++b_calls; });

    expect(throws<std::runtime_error>([&] {
      batch([&] {
        a = 1;
        b = 1;
      });
    }));

    expect(b_calls == 1_i) << "a failing callback should not stop the others";
    expect(not rill::is_batching());
  };

  "writes_during_flush"_test = [] {
    auto a = signal{0};
    auto b = signal{0};

    std::ignore = a.subscribe([&] { b = a.peek() * 10; });

    auto seen = 0;
    std::ignore = b.subscribe([&] { seen = b.peek(); });

    batch([&] { a = 1; });
    expect(seen == 10_i);
  };
};
