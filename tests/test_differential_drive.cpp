#include "doctest/doctest.h"

#include "config/Params.h"
#include "control/DifferentialDrive.h"
#include "fakes/FakeOutputs.h"

#include <cmath>

using control::DifferentialDrive;

TEST_CASE("blend drives straight when steering is zero") {
	for (int i = -10; i <= 10; ++i) {
		const float t = 0.1f * (float)i;
		const auto s = DifferentialDrive::blend(0.0f, t);
		CHECK(s.left == t);
		CHECK(s.right == t);
	}
}

TEST_CASE("blend quadrant formulas") {
	SUBCASE("forward right slows the right side") {
		const auto s = DifferentialDrive::blend(0.3f, 0.5f);
		CHECK(s.left == doctest::Approx(0.5f));
		CHECK(s.right == doctest::Approx(0.2f));
	}
	SUBCASE("forward left slows the left side") {
		const auto s = DifferentialDrive::blend(-0.3f, 0.5f);
		CHECK(s.left == doctest::Approx(0.2f));
		CHECK(s.right == doctest::Approx(0.5f));
	}
	SUBCASE("reverse right") {
		const auto s = DifferentialDrive::blend(0.2f, -0.4f);
		CHECK(s.left == doctest::Approx(-0.4f));
		CHECK(s.right == doctest::Approx(-0.2f));
	}
	SUBCASE("reverse left") {
		const auto s = DifferentialDrive::blend(-0.2f, -0.4f);
		CHECK(s.left == doctest::Approx(-0.2f));
		CHECK(s.right == doctest::Approx(-0.4f));
	}
}

TEST_CASE("blend holds still when only steering is commanded") {
	const auto s = DifferentialDrive::blend(0.7f, 0.0f);
	CHECK(s.left == 0.0f);
	CHECK(s.right == 0.0f);
	const auto s2 = DifferentialDrive::blend(-1.0f, 0.0f);
	CHECK(s2.left == 0.0f);
	CHECK(s2.right == 0.0f);
}

TEST_CASE("blend stays inside [-1, 1] at full lock") {
	const float corners[][2] = {
		{1.0f, 1.0f}, {-1.0f, 1.0f}, {1.0f, -1.0f}, {-1.0f, -1.0f}};
	for (const auto &c : corners) {
		const auto s = DifferentialDrive::blend(c[0], c[1]);
		CHECK(s.left >= -1.0f);
		CHECK(s.left <= 1.0f);
		CHECK(s.right >= -1.0f);
		CHECK(s.right <= 1.0f);
	}

	fakes::FakeMotorOutput motors;
	DifferentialDrive drive(motors, cfg::DifferentialParams{});
	for (const auto &c : corners) {
		REQUIRE(drive.run(c[0], c[1]).ok());
	}
	for (const auto &run : motors.runs)
		CHECK(run.speed <= 100);
}

TEST_CASE("DifferentialDrive rejects invalid commands before any output") {
	fakes::FakeMotorOutput motors;
	DifferentialDrive drive(motors, cfg::DifferentialParams{});

	CHECK(drive.run(1.5f, 0.0f).code == rcd::Errc::InvalidCommand);
	CHECK(drive.run(0.0f, -2.0f).code == rcd::Errc::InvalidCommand);
	CHECK(drive.run(std::nanf(""), 0.0f).code == rcd::Errc::InvalidCommand);
	CHECK(motors.runs.empty());
}

TEST_CASE("DifferentialDrive dispatches through the polarity table") {
	fakes::FakeMotorOutput motors;
	DifferentialDrive drive(motors, cfg::DifferentialParams{});

	REQUIRE(drive.run(0.0f, 0.6f).ok());
	REQUIRE(motors.runs.size() == 4);

	for (uint8_t id = 1; id <= 4; ++id) {
		const auto *r = motors.last(id);
		REQUIRE(r != nullptr);
		CHECK(r->speed == 60);
	}
	CHECK(motors.last(1)->forward);
	CHECK(motors.last(2)->forward);
	CHECK(motors.last(3)->forward);
	// 右後輪は配線が逆
	CHECK_FALSE(motors.last(4)->forward);

	REQUIRE(drive.run(0.0f, -0.6f).ok());
	CHECK_FALSE(motors.last(1)->forward);
	CHECK_FALSE(motors.last(3)->forward);
	CHECK(motors.last(4)->forward);
}

TEST_CASE("DifferentialDrive sends each side its blended magnitude") {
	fakes::FakeMotorOutput motors;
	DifferentialDrive drive(motors, cfg::DifferentialParams{});

	REQUIRE(drive.run(0.5f, 1.0f).ok());
	CHECK(drive.lastSpeeds().left == doctest::Approx(1.0f));
	CHECK(drive.lastSpeeds().right == doctest::Approx(0.5f));
	CHECK(motors.last(1)->speed == 100);
	CHECK(motors.last(2)->speed == 100);
	CHECK(motors.last(3)->speed == 50);
	CHECK(motors.last(4)->speed == 50);
}

TEST_CASE("DifferentialDrive honors a custom wiring table and scale") {
	cfg::DifferentialParams p;
	p.speed_scale = 255;
	p.wiring = {{
		{0, cfg::Side::Left, true},
		{1, cfg::Side::Right, false},
		{2, cfg::Side::Left, false},
		{3, cfg::Side::Right, true},
	}};
	fakes::FakeMotorOutput motors;
	DifferentialDrive drive(motors, p);

	REQUIRE(drive.run(0.0f, 1.0f).ok());
	CHECK(motors.last(0)->speed == 255);
	CHECK_FALSE(motors.last(0)->forward);
	CHECK(motors.last(1)->forward);
	CHECK(motors.last(2)->forward);
	CHECK_FALSE(motors.last(3)->forward);
}

TEST_CASE("DifferentialDrive zero speed is reported as not forward") {
	fakes::FakeMotorOutput motors;
	DifferentialDrive drive(motors, cfg::DifferentialParams{});

	const auto cmd = drive.commandFor(0.0f);
	CHECK(cmd.speed == 0);
	CHECK_FALSE(cmd.forward);
}

TEST_CASE("DifferentialDrive shutdown releases every motor") {
	fakes::FakeMotorOutput motors;
	DifferentialDrive drive(motors, cfg::DifferentialParams{});
	REQUIRE(drive.run(0.2f, 0.4f).ok());

	drive.shutdown();
	REQUIRE(motors.released.size() == 4);
	CHECK(motors.released[0] == 1);
	CHECK(motors.released[3] == 4);
	CHECK(drive.lastSpeeds().left == 0.0f);
}

TEST_CASE("DifferentialDrive magnitudes survive float representation error") {
	const float throttles[] = {0.1f, 0.2f, 0.3f, 0.4f, 0.5f,
							   0.6f, 0.7f, 0.8f, 0.9f};
	for (int i = 0; i < 9; ++i) {
		fakes::FakeMotorOutput motors;
		DifferentialDrive drive(motors, cfg::DifferentialParams{});
		CAPTURE(throttles[i]);
		REQUIRE(drive.run(0.0f, throttles[i]).ok());
		CHECK(motors.last(1)->speed == (i + 1) * 10);
		CHECK(motors.last(4)->speed == (i + 1) * 10);
	}
	// 0.5 - 0.3 は float で 0.19999999
	fakes::FakeMotorOutput motors;
	DifferentialDrive drive(motors, cfg::DifferentialParams{});
	REQUIRE(drive.run(0.3f, 0.5f).ok());
	CHECK(motors.last(3)->speed == 20);
}
