#include "common.h"

#include <fmt/format.h>

#include <optional>
#include <string>
#include <vector>

using namespace std::string_literals;

static suite<"integration_tests"> _ = [] {
  "business card"_test = [] {
    using msgs_t = std::vector<std::string>;
    auto msgs = msgs_t{};
    auto tag = [&msgs](const char *id) { msgs.push_back(id); };

    enum class shipment_t {
      opt_out,
      dhl,
      print_at_home,
    };

    auto ship_via_dhl = [&](const std::string &msg) {
      msgs.push_back(fmt::format("Shipping via DHL: {}", msg));
    };
    auto email = [&](const std::string &msg) {
      msgs.push_back(fmt::format("Emailing: {}", msg));
    };

    auto first_name = signal{"John"s};
    auto last_name = signal{"Doe"s};
    auto full_name = computed{[=] {
      tag("full_name");
      return first_name() + " " + last_name();
    }};

    auto pseudonym = signal<std::optional<std::string>>{};
    auto display_name = computed{[=] {
      tag("display_name");
      if (const auto &p = pseudonym())
        return *p;
      return full_name();
    }};

    auto expensive_author_registry_lookup = [](const std::string &name) {
      return name == "Jane Austen" or name == "J.K. Rowling";
    };
    auto is_writer = computed{[=] {
      tag("is_writer");
      return expensive_author_registry_lookup(display_name());
    }};

    auto business_card = computed{[=] {
      tag("business_card");
      const auto name = display_name();
      const auto writer = is_writer();
      return fmt::format("Business card of {}{}", name,
                         writer ? ", writer" : "");
    }};

    expect(that % msgs == msgs_t{
                              "full_name",
                              "display_name",
                              "is_writer",
                              "business_card",
                          })
        << "computeds should evaluate once on construction";
    msgs.clear();

    auto shipment = signal{shipment_t::dhl};
    auto dhl = effect([=] {
      tag("effect:dhl");
      if (shipment() == shipment_t::dhl)
        ship_via_dhl(business_card());
    });

    auto print_at_home = effect([=] {
      tag("effect:print_at_home");
      if (shipment() == shipment_t::print_at_home)
        email(business_card());
    });

    expect(that % msgs == msgs_t{
                              "effect:dhl",
                              "Shipping via DHL: Business card of John Doe",
                              "effect:print_at_home",
                          });
    msgs.clear();

    // Writing the same values should not trigger anything
    first_name = "John"s;
    last_name = "Doe"s;
    expect(that % msgs == msgs_t{});

    pseudonym = "Jane Doe"s;
    expect(that % msgs == msgs_t{
                              "display_name",
                              "is_writer",
                              "business_card",
                              "effect:dhl",
                              "Shipping via DHL: Business card of Jane Doe",
                          });
    msgs.clear();

    // display_name does not read full_name while a pseudonym is set
    first_name = "Jane"s;
    expect(that % msgs == msgs_t{});

    pseudonym = std::nullopt;
    expect(that % msgs == msgs_t{
                              "display_name",
                              "full_name",
                              "is_writer",
                              "business_card",
                              "effect:dhl",
                              "Shipping via DHL: Business card of Jane Doe",
                          });
    msgs.clear();

    last_name = "Austen"s;
    expect(that % msgs ==
           msgs_t{
               "full_name",
               "display_name",
               "is_writer",
               "business_card",
               "effect:dhl",
               "Shipping via DHL: Business card of Jane Austen, writer",
           });
    msgs.clear();

    // Both writes are delivered as a single update
    batch([&] {
      first_name = "Joanna"s;
      last_name = "Rowling"s;
    });
    expect(that % msgs ==
           msgs_t{
               "full_name",
               "display_name",
               "is_writer",
               "business_card",
               "effect:dhl",
               "Shipping via DHL: Business card of Joanna Rowling",
           });
    msgs.clear();

    shipment = shipment_t::print_at_home;
    expect(that % msgs == msgs_t{
                              "effect:print_at_home",
                              "Emailing: Business card of Joanna Rowling",
                              "effect:dhl",
                          });
    msgs.clear();

    shipment = shipment_t::opt_out;
    expect(that % msgs == msgs_t{
                              "effect:print_at_home",
                              "effect:dhl",
                          });
    msgs.clear();

    // Nothing observes the business card right now
    first_name = "John"s;
    last_name = "Doe"s;
    pseudonym = std::nullopt;
    expect(that % msgs == msgs_t{});

    shipment = shipment_t::print_at_home;
    expect(that % msgs == msgs_t{
                              "effect:print_at_home",
                              "full_name",
                              "display_name",
                              "is_writer",
                              "business_card",
                              "Emailing: Business card of John Doe",
                              "effect:dhl",
                          });
    msgs.clear();

    dhl();
    print_at_home();
    shipment = shipment_t::dhl;
    expect(that % msgs == msgs_t{}) << "disposed effects should not run";
  };
};
