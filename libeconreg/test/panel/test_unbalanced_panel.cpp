#include <catch2/catch_test_macros.hpp>

#include "libeconreg/panel/unbalanced_panel.hpp"
#include "panel_fixtures.hpp"

#include <cmath>
#include <limits>

using namespace libeconreg;
using namespace libeconreg::panel;

TEST_CASE("Unbalanced panel: Neutralize", "[panel][unbalanced]") {
	PanelData data = test::MakePanel(5, 3);
	data.y(0, 1) = std::nan("");
	data.x[2](3, 1) = std::numeric_limits<double>::infinity();

	NeutralizedPanel out = UnbalancedPanel::Neutralize(data);

	SECTION("Mask marks every non-finite cell") {
		REQUIRE(out.mask.count() == 13);
		REQUIRE_FALSE(out.mask(0, 1));
		REQUIRE_FALSE(out.mask(3, 2));
	}

	SECTION("Whole row is zeroed") {
		REQUIRE(out.data.y(0, 1) == 0.0);
		REQUIRE(out.data.x[1].row(0).isZero(0.0));
		REQUIRE(out.data.y(3, 2) == 0.0);
		REQUIRE(out.data.x[2].row(3).isZero(0.0));
		REQUIRE(out.data.y(1, 1) == data.y(1, 1));
		REQUIRE(out.data.x[0] == data.x[0]);
	}

	SECTION("Input is untouched") {
		REQUIRE(std::isnan(data.y(0, 1)));
		REQUIRE(std::isinf(data.x[2](3, 1)));
	}

	SECTION("Observations per period") {
		Eigen::VectorXi nb = UnbalancedPanel::ObservationsPerPeriod(out.mask);
		REQUIRE(nb.size() == 5);
		REQUIRE(nb(0) == 2);
		REQUIRE(nb(1) == 3);
		REQUIRE(nb(3) == 2);
		REQUIRE(nb.sum() == 13);
	}
}

TEST_CASE("Unbalanced panel: Neutralize in place", "[panel][unbalanced]") {
	PanelData data = test::MakePanel(4, 2);
	data.x[0](2, 0) = std::nan("");

	PanelMask mask = UnbalancedPanel::NeutralizeInPlace(data);
	REQUIRE_FALSE(mask(2, 0));
	REQUIRE(mask.count() == 7);
	REQUIRE(data.y(2, 0) == 0.0);
	REQUIRE(data.x[0].row(2).isZero(0.0));
	REQUIRE(data.x[0].allFinite());

	SECTION("Balanced panel keeps every cell") {
		PanelData clean = test::MakePanel(4, 2);
		PanelData before = clean;
		PanelMask full = UnbalancedPanel::NeutralizeInPlace(clean);
		REQUIRE(full.all());
		REQUIRE(clean.y == before.y);
	}
}

TEST_CASE("Unbalanced panel: Errors", "[panel][unbalanced][errors]") {
	PanelData data = test::MakePanel(4, 2);
	data.x.pop_back();
	REQUIRE_THROWS_AS(UnbalancedPanel::Neutralize(data), core::DimensionMismatchError);
}
