#include <rill/rill.h>

#include <fmt/core.h>

#include <string>
#include <vector>

using namespace rill;
using namespace std::string_literals;

int main() {
  auto first_name = signal{"Anita"s};
  auto last_name = signal{"Laera"s};
  auto nick_name = signal{""s};

  auto full_name = computed{[=] {
    fmt::print("computed full_name\n");
    if (nick_name() != "")
      return nick_name();
    else
      return first_name() + " " + last_name();
  }};

  auto display_full = signal{true};
  auto dispose = effect([=] {
    fmt::print("effect\n");
    if (display_full())
      fmt::print(">> {}\n", full_name());
    else
      fmt::print("display disabled\n");
  });

  // full_name >> effect >> Missi Laera
  first_name.set("Missi");
  // full_name >> effect >> Missi Valkering
  last_name.set("Valkering");
  // full_name >> effect >> Erik Valkering
  first_name.set("Erik");

  // Only one notification for both writes.
  batch([&] {
    first_name = "Anita"s;
    last_name = "Laera"s;
  });

  // effect >> display disabled
  display_full.set(false);
  // full_name is not observed anymore: nothing is printed
  nick_name.set("Erik Engelbertus Johannes Valkering");

  // Selecting a row only recomputes the rows whose selection changed.
  auto selected = signal{-1};
  auto rows = std::vector<computed<std::string>>{};
  for (auto i = 0; i < 5; ++i)
    rows.push_back(computed<std::string>{[=] {
      fmt::print("computed row {}\n", i);
      return selected.is(i) ? "[x]" : "[ ]";
    }});

  // computed row 2
  selected.set(2);
  for (auto &row : rows)
    fmt::print("{} ", row);
  fmt::print("\n");

  // computed row 2, computed row 4
  selected.set(4);
  for (auto &row : rows)
    fmt::print("{} ", row);
  fmt::print("\n");

  dispose();
}
