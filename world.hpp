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

#pragma once

#include <optional>
#include <random>
#include <array>

#include "pos.hpp"
#include "defines.h"
#include "gridmap.hpp"

struct CellAttributes
{
	double water_level = 0.;         // [0,1]
	int growth_progress = 0;         // [0,100]
	double disease_probability = 0.; // [0,1]
	int last_watered = 0;            // tick index

	std::string str() const;
};

/** a partial attribute map: only the fields that are set get written */
struct AttributeUpdate
{
	std::optional<double> water_level;
	std::optional<int> growth_progress;
	std::optional<double> disease_probability;
	std::optional<int> last_watered;

	void apply_to(CellAttributes& attrs) const;
};

struct Cell
{
	cell_state_t state = CELL_INITIAL;
	CellAttributes attributes;
};

struct Weather
{
	double temperature = 25.;
	double humidity = 60.;
	bool rain_forecast_24h = false;
	double wind_speed = 10.;

	static constexpr double HEAT_STRESS_TEMPERATURE = 32.;
	bool heat_stress() const { return temperature > HEAT_STRESS_TEMPERATURE; }

	std::string str() const;
};

struct YieldPrediction
{
	double estimated_yield = 0.;
	int current_harvest = 0;
	double potential_yield = 0.;
	int steps_to_harvest = 0;
	int estimated_harvest_step = 0;
	double average_growth_progress = 0.;
	int healthy_crops = 0;
	int at_risk_crops = 0;
};

struct StressIndicators
{
	int water_stressed_count = 0;
	int temperature_stressed_count = 0;
	int total_crops = 0;
	double water_stress_percentage = 0.;
	double temperature_stress_percentage = 0.;
	double overall_health_score = 100.;
};

struct WeatherSettings
{
	int interval = 5; // ticks between weather changes
	double rain_chance = 0.1;
};

/** The authoritative state of the farm: one Cell per grid coordinate, the
  * weather, the harvest counter and the tick counter.
  *
  * Reads outside the grid return neutral values (an Initial cell with zeroed
  * attributes), writes outside the grid throw std::out_of_range. */
class FarmWorld
{
	public:
		FarmWorld(int width, int height, unsigned seed = 42, WeatherSettings weather_settings = WeatherSettings());

		int width() const { return cells.get_width(); }
		int height() const { return cells.get_height(); }
		bool contains(const Pos& pos) const { return cells.contains(pos); }
		std::vector<Pos> positions() const { return cells.positions(); }

		cell_state_t get_cell_state(const Pos& pos) const { return cells.at(pos).state; }
		void set_cell_state(const Pos& pos, cell_state_t state) { cells.at(pos).state = state; }

		const CellAttributes& get_cell_attributes(const Pos& pos) const { return cells.at(pos).attributes; }
		/** merges `update` into the cell's attributes, leaving unset fields alone */
		void update_cell_attributes(const Pos& pos, const AttributeUpdate& update) { update.apply_to(cells.at(pos).attributes); }

		int count_cells_by_state(cell_state_t state) const;
		std::array<int, N_CELL_STATES> count_cells() const;

		const Weather& weather() const { return weather_; }
		/** for external weather sources and tests. the periodic updater will overwrite this again. */
		void set_weather(const Weather& w) { weather_ = w; }

		int harvested_count() const { return harvested_count_; }
		void record_harvest() { harvested_count_++; }

		int step_count() const { return step_count_; }

		/** advances the tick counter, updates the weather every WeatherSettings::interval
		  * ticks and lets the crops grow and dry out. */
		void refresh();

		/** the random source shared by everything that simulates chance on this farm */
		std::mt19937& rng() { return rng_; }

		YieldPrediction yield_prediction() const;
		StressIndicators stress_indicators() const;

		void invariant() const;

	private:
		void update_weather();
		void step_cells();

		GridMap<Cell> cells;
		Weather weather_;
		WeatherSettings weather_settings;
		int harvested_count_ = 0;
		int step_count_ = 0;
		std::mt19937 rng_;
};
