/*
 * Copyright (c) 2017 Florian Jung
 *
 * This file is part of farmsim.
 *
 * farmsim is free software: you can redistribute it and/or
 * modify it under the terms of the GNU General Public License,
 * version 3, as published by the Free Software Foundation.
 *
 * farmsim is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with farmsim. If not, see <http://www.gnu.org/licenses/>.
 */

#include "world.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <sstream>

using namespace std;

// crops dry out by this much per tick
const double EVAPORATION = 0.05;
// below this, crops stop growing and need water
const double DRY_LEVEL = 0.3;
// above this (and past half their growth), growing crops count as healthy
const double WELL_WATERED_LEVEL = 0.5;
const int GROWTH_PER_TICK = 2;

static double round_to(double value, int decimals)
{
	double factor = pow(10., decimals);
	return round(value * factor) / factor;
}

string CellAttributes::str() const
{
	ostringstream s;
	s << "water=" << water_level << " growth=" << growth_progress << " disease=" << disease_probability << " last_watered=" << last_watered;
	return s.str();
}

void AttributeUpdate::apply_to(CellAttributes& attrs) const
{
	if (water_level.has_value()) attrs.water_level = *water_level;
	if (growth_progress.has_value()) attrs.growth_progress = *growth_progress;
	if (disease_probability.has_value()) attrs.disease_probability = *disease_probability;
	if (last_watered.has_value()) attrs.last_watered = *last_watered;
}

string Weather::str() const
{
	ostringstream s;
	s << temperature << "C, " << humidity << "% humidity, wind " << wind_speed << "km/h" << (rain_forecast_24h ? ", rain forecast" : "");
	return s.str();
}

FarmWorld::FarmWorld(int width, int height, unsigned seed, WeatherSettings weather_settings_) :
	cells(width, height), weather_settings(weather_settings_), rng_(seed)
{
	if (weather_settings.interval <= 0)
		throw invalid_argument("the weather interval must be positive");
}

int FarmWorld::count_cells_by_state(cell_state_t state) const
{
	return int(count_if(cells.begin(), cells.end(), [state](const Cell& c) { return c.state == state; }));
}

array<int, N_CELL_STATES> FarmWorld::count_cells() const
{
	array<int, N_CELL_STATES> result{};
	for (const Cell& c : cells)
		result[c.state]++;
	return result;
}

void FarmWorld::refresh()
{
	step_count_++;

	if (step_count_ % weather_settings.interval == 0)
		update_weather();

	step_cells();
	invariant();
}

void FarmWorld::update_weather()
{
	Logger log("weather", Logger::DETAIL);

	uniform_real_distribution<double> temperature_drift(-2., 2.);
	uniform_real_distribution<double> humidity_drift(-5., 5.);
	uniform_real_distribution<double> wind_drift(-3., 3.);
	bernoulli_distribution rain(weather_settings.rain_chance);

	weather_.temperature = clamp(weather_.temperature + temperature_drift(rng_), 20., 35.);
	weather_.humidity = clamp(weather_.humidity + humidity_drift(rng_), 40., 90.);
	weather_.rain_forecast_24h = rain(rng_);
	weather_.wind_speed = clamp(weather_.wind_speed + wind_drift(rng_), 5., 40.);

	log << "tick " << step_count_ << ": " << weather_.str() << endl;
}

void FarmWorld::step_cells()
{
	for (Cell& cell : cells)
	{
		if (cell.state != CELL_GROWING && cell.state != CELL_HEALTHY)
			continue;

		CellAttributes& attrs = cell.attributes;
		attrs.water_level = max(0., attrs.water_level - EVAPORATION);

		if (attrs.water_level > DRY_LEVEL)
			attrs.growth_progress = min(100, attrs.growth_progress + GROWTH_PER_TICK);

		if (cell.state == CELL_GROWING)
		{
			if (attrs.water_level < DRY_LEVEL)
				cell.state = CELL_NEED_WATER;
			else if (attrs.growth_progress > 50 && attrs.water_level > WELL_WATERED_LEVEL)
				cell.state = CELL_HEALTHY;
		}
		else // CELL_HEALTHY
		{
			if (attrs.water_level < DRY_LEVEL)
				cell.state = CELL_NEED_WATER;
			else if (attrs.growth_progress >= 100)
				cell.state = CELL_READY_TO_HARVEST;
		}
	}
}

YieldPrediction FarmWorld::yield_prediction() const
{
	const double YIELD_HEALTHY = 1.0;
	const double YIELD_GROWING = 0.7;
	const double YIELD_DISEASED = 0.3;

	auto counts = count_cells();
	YieldPrediction result;

	int total_growth = 0;
	int crop_count = 0;
	for (const Cell& c : cells)
		if (c.state == CELL_GROWING || c.state == CELL_HEALTHY || c.state == CELL_NEED_WATER)
		{
			total_growth += c.attributes.growth_progress;
			crop_count++;
		}
	double avg_growth = crop_count > 0 ? double(total_growth) / crop_count : 0.;

	double estimated = counts[CELL_HEALTHY] * YIELD_HEALTHY
		+ counts[CELL_GROWING] * YIELD_GROWING
		+ counts[CELL_DISEASED] * YIELD_DISEASED
		+ counts[CELL_READY_TO_HARVEST] * YIELD_HEALTHY;

	// growth advances by GROWTH_PER_TICK while watered
	result.steps_to_harvest = avg_growth > 0. ? int((100. - avg_growth) / GROWTH_PER_TICK) : 0;
	result.estimated_yield = round_to(estimated, 2);
	result.current_harvest = harvested_count_;
	result.potential_yield = estimated + harvested_count_;
	result.estimated_harvest_step = step_count_ + result.steps_to_harvest;
	result.average_growth_progress = round_to(avg_growth, 1);
	result.healthy_crops = counts[CELL_HEALTHY];
	result.at_risk_crops = counts[CELL_DISEASED];
	return result;
}

StressIndicators FarmWorld::stress_indicators() const
{
	StressIndicators result;

	for (const Cell& c : cells)
	{
		if (c.state != CELL_GROWING && c.state != CELL_HEALTHY && c.state != CELL_NEED_WATER && c.state != CELL_SOWN)
			continue;

		result.total_crops++;
		if (c.attributes.water_level < DRY_LEVEL)
			result.water_stressed_count++;
		if (weather_.heat_stress() && c.attributes.water_level < WELL_WATERED_LEVEL)
			result.temperature_stressed_count++;
	}

	if (result.total_crops > 0)
	{
		result.water_stress_percentage = round_to(100. * result.water_stressed_count / result.total_crops, 1);
		result.temperature_stress_percentage = round_to(100. * result.temperature_stressed_count / result.total_crops, 1);
		result.overall_health_score = round_to(100. * (result.total_crops - result.water_stressed_count - result.temperature_stressed_count) / result.total_crops, 1);
	}
	return result;
}

void FarmWorld::invariant() const
{
#ifndef NDEBUG
	int total = 0;
	for (const Cell& c : cells)
	{
		assert(c.state >= CELL_INITIAL && c.state < N_CELL_STATES);
		assert(c.attributes.water_level >= 0. && c.attributes.water_level <= 1.);
		assert(c.attributes.growth_progress >= 0 && c.attributes.growth_progress <= 100);
		total++;
	}
	assert(size_t(total) == cells.size());
#endif
}
