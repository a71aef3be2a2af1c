#include "hos_planner/location_resolver.hpp"

#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "hos_planner/logging.hpp"

namespace hos_planner {

namespace {

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::vector<std::string_view> split_commas(std::string_view text) {
    std::vector<std::string_view> tokens;
    std::size_t begin = 0;
    while (true) {
        const std::size_t comma = text.find(',', begin);
        tokens.push_back(trim(text.substr(begin, comma == std::string_view::npos ? std::string_view::npos : comma - begin)));
        if (comma == std::string_view::npos) {
            break;
        }
        begin = comma + 1;
    }
    return tokens;
}

}  // namespace

std::string NullLocationResolver::resolve(const Coordinate&) {
    return {};
}

TimeoutLocationResolver::TimeoutLocationResolver(LocationResolverPtr inner, std::chrono::milliseconds timeout)
    : inner_(std::move(inner)),
      timeout_(timeout) {
    if (inner_ == nullptr) {
        throw std::invalid_argument("TimeoutLocationResolver requires an inner resolver");
    }
    if (timeout_.count() <= 0) {
        throw std::invalid_argument("TimeoutLocationResolver timeout must be positive");
    }
}

std::string TimeoutLocationResolver::resolve(const Coordinate& coordinate) {
    auto promise_place = std::make_shared<std::promise<std::string>>();
    std::future<std::string> future_place = promise_place->get_future();

    std::thread(
        [inner = inner_, promise_place, coordinate]() {
            try {
                promise_place->set_value(inner->resolve(coordinate));
            } catch (...) {
                promise_place->set_exception(std::current_exception());
            }
        }
    ).detach();

    if (future_place.wait_for(timeout_) != std::future_status::ready) {
        throw ResolverTimeoutError(fmt::format(
            "Place lookup for ({:.4f}, {:.4f}) exceeded {} ms",
            coordinate.latitude_deg,
            coordinate.longitude_deg,
            timeout_.count()
        ));
    }
    return future_place.get();
}

std::chrono::milliseconds TimeoutLocationResolver::timeout() const noexcept {
    return timeout_;
}

ResolvedPlace parse_place(std::string_view formatted) {
    ResolvedPlace place{};
    place.formatted = std::string{trim(formatted)};
    if (place.formatted.empty()) {
        return place;
    }

    const std::vector<std::string_view> tokens = split_commas(place.formatted);
    if (tokens.size() < 2) {
        return place;
    }
    const std::string_view city = tokens[tokens.size() - 2];
    const std::string_view region = tokens[tokens.size() - 1];
    if (!city.empty()) {
        place.city = std::string{city};
    }
    if (!region.empty()) {
        place.region = std::string{region};
    }
    return place;
}

PlaceLookup lookup_place(LocationResolver& resolver, const Coordinate& coordinate) {
    PlaceLookup lookup{};
    try {
        lookup.place = parse_place(resolver.resolve(coordinate));
    } catch (const ResolverTimeoutError& exc) {
        get_logger()->warn("Location lookup timed out: {}", exc.what());
        lookup.warning = PlanWarning{WarningKind::ResolverTimeout, exc.what()};
    } catch (const std::exception& exc) {
        get_logger()->warn("Location lookup failed: {}", exc.what());
        lookup.warning = PlanWarning{WarningKind::ResolverFailure, exc.what()};
    }
    return lookup;
}

}  // namespace hos_planner
