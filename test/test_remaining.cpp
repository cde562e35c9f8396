#include "fixtures.h"

#include <kssampling/remaining.h>

#include <limits>

using namespace KSSampling;

TEST_CASE("remaining set starts with every non-excluded index", "[remaining]") {
    const RemainingSet remains{5, {1, 3}};

    REQUIRE(remains.size() == 3);
    REQUIRE(std::vector<Index>(remains.indices().begin(), remains.indices().end()) == std::vector<Index>{0, 2, 4});
    REQUIRE(remains.values().size() == 3);
    REQUIRE(remains.value(0) == std::numeric_limits<double>::infinity());
}

TEST_CASE("remaining set folds distances with an element-wise minimum", "[remaining]") {
    RemainingSet remains{3, {}};
    remains.fold(Eigen::Vector3d{4.0, 1.0, 6.0});
    remains.fold(Eigen::Vector3d{5.0, 0.5, 2.0});

    REQUIRE(remains.value(0) == 4.0);
    REQUIRE(remains.value(1) == 0.5);
    REQUIRE(remains.value(2) == 2.0);
    REQUIRE(remains.argmax() == 0);
}

TEST_CASE("remaining set ties resolve to the smallest index after swap removals", "[remaining]") {
    RemainingSet remains{4, {}};
    remains.fold(Eigen::Vector4d{1.0, 5.0, 5.0, 2.0});
    REQUIRE(remains.index(remains.argmax()) == 1);

    // Removing the front moves index 3 into position 0
    REQUIRE(remains.remove(0) == 0);
    REQUIRE(remains.size() == 3);
    REQUIRE(remains.index(0) == 3);
    REQUIRE(remains.value(0) == 2.0);

    auto position = remains.argmax();
    REQUIRE(remains.index(position) == 1);
    REQUIRE(remains.remove(position) == 1);

    position = remains.argmax();
    REQUIRE(remains.index(position) == 2);
    REQUIRE(remains.value(position) == 5.0);
}

TEST_CASE("remaining set stays aligned while it drains", "[remaining]") {
    RemainingSet remains{6, {2}};
    remains.fold(Eigen::VectorXd::LinSpaced(5, 1.0, 5.0));

    std::vector<Index> order;
    while (!remains.empty()) {
        const auto position = remains.argmax();
        REQUIRE(remains.value(position) == double(remains.size()));
        order.push_back(remains.remove(position));
    }
    REQUIRE(order == std::vector<Index>{5, 4, 3, 1, 0});
}

TEST_CASE("remaining set rejects misaligned folds and empty selections", "[remaining][errors]") {
    RemainingSet remains{3, {0, 1, 2}};
    REQUIRE(remains.empty());
    REQUIRE_THROWS_AS(remains.argmax(), PreconditionError);
    REQUIRE_THROWS_AS(remains.fold(Eigen::VectorXd::Zero(2)), PreconditionError);
}
