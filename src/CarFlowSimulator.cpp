#include "CarFlowSimulator.hpp"

#include "CarFollowingModel.hpp"

#include <algorithm>

namespace gridflow
{
    namespace
    {
        constexpr double INITIAL_SPEED_RATIO = 0.5;   // cars start at half the desired speed
        constexpr double INITIAL_POSITION_SPAN = 0.9; // and somewhere in the first 90% of a lane
    }

    CarFlowSimulator::CarFlowSimulator(const GridConfig &config)
        : config(config), next_car_id(0)
    {
    }

    void CarFlowSimulator::populate(const RoadNetwork &network, IRandomSource &random)
    {
        const auto &roads = network.roadLaneIds();
        if (roads.empty())
        {
            return;
        }

        car_list.reserve(car_list.size() + config.traffic.car_count);
        for (uint32_t i = 0; i < config.traffic.car_count; ++i)
        {
            const Lane &lane = network.lane(roads[random.pickIndex(roads.size())]);
            const double t = random.uniform(0.0, INITIAL_POSITION_SPAN) * lane.length();
            addCar(lane.id, t, config.driver.desired_speed * INITIAL_SPEED_RATIO);
        }
    }

    uint32_t CarFlowSimulator::addCar(LaneId lane, double t, double v)
    {
        Car car(next_car_id++, lane, t, std::max(0.0, v));
        car.flow_state = classifyFlow(car.a, car.v, config.traffic, config.driver.desired_speed);
        car_list.push_back(car);
        return car.id;
    }

    void CarFlowSimulator::clear()
    {
        car_list.clear();
        next_car_id = 0;
    }

    CarFlowSimulator::LaneOccupancy CarFlowSimulator::buildOccupancy() const
    {
        LaneOccupancy occupancy;
        for (size_t i = 0; i < car_list.size(); ++i)
        {
            occupancy[car_list[i].lane].push_back(i);
        }

        for (auto &entry : occupancy)
        {
            std::sort(entry.second.begin(), entry.second.end(),
                      [this](size_t lhs, size_t rhs)
                      {
                          const Car &a = car_list[lhs];
                          const Car &b = car_list[rhs];
                          if (a.t != b.t)
                          {
                              return a.t > b.t;
                          }
                          return a.id < b.id;
                      });
        }
        return occupancy;
    }

    const Car *CarFlowSimulator::rearmostOccupant(LaneId lane, const LaneOccupancy &occupancy) const
    {
        auto it = occupancy.find(lane);
        if (it == occupancy.end() || it->second.empty())
        {
            return nullptr;
        }
        return &car_list[it->second.back()];
    }

    CarDecision CarFlowSimulator::decide(size_t car_index,
                                         const LaneOccupancy &occupancy,
                                         const RoadNetwork &network,
                                         const SignalController &signals,
                                         IRandomSource &random) const
    {
        const Car &car = car_list[car_index];
        const Lane &lane = network.lane(car.lane);
        const TrafficConfig &traffic = config.traffic;

        CarDecision decision;
        decision.gap = traffic.free_gap;
        decision.approach_rate = 0.0;

        const std::vector<size_t> &peers = occupancy.at(car.lane);
        const auto self_it = std::find(peers.begin(), peers.end(), car_index);
        const Car *leader = self_it != peers.begin() ? &car_list[*(self_it - 1)] : nullptr;

        if (leader)
        {
            decision.gap = leader->t - car.t - traffic.car_length;
            decision.approach_rate = car.v - leader->v;
        }
        else
        {
            const double distance_to_end = lane.length() - car.t;
            std::optional<LaneId> target = car.target_lane;

            if (lane.isRoad())
            {
                const LightState light = signals.permissionFor(lane.to_node, lane.axis);
                if (light != LightState::Green)
                {
                    // Treat the stop line as a stationary obstacle
                    decision.gap = distance_to_end - traffic.stop_margin;
                    decision.approach_rate = car.v;
                }
                else
                {
                    if (!target && !lane.next_lanes.empty())
                    {
                        target = lane.next_lanes[random.pickIndex(lane.next_lanes.size())];
                        decision.target_lane = target;
                    }

                    if (target)
                    {
                        if (const Car *last = rearmostOccupant(*target, occupancy))
                        {
                            const double virtual_gap = distance_to_end + last->t - traffic.car_length;
                            if (virtual_gap < traffic.lookahead_distance)
                            {
                                decision.gap = virtual_gap;
                                decision.approach_rate = car.v - last->v;
                            }
                        }
                    }
                }
            }
            else
            {
                // Junctions carry no signal; the road lane before them already passed it
                if (!target && !lane.next_lanes.empty())
                {
                    target = lane.next_lanes.front();
                    decision.target_lane = target;
                }

                if (target)
                {
                    if (const Car *last = rearmostOccupant(*target, occupancy))
                    {
                        decision.gap = distance_to_end + last->t - traffic.car_length;
                        decision.approach_rate = car.v - last->v;
                    }
                }
            }
        }

        decision.acceleration = idmAcceleration(config.driver, car.v, decision.approach_rate, decision.gap);

        // Discontinuous override on top of the continuous model: inside the
        // minimum gap the car is stopped on the spot.
        if (decision.gap < traffic.min_gap)
        {
            decision.acceleration = emergencyBrakeAcceleration(config.driver);
            decision.emergency_stop = true;
        }

        return decision;
    }

    std::vector<CarDecision> CarFlowSimulator::perceive(const RoadNetwork &network,
                                                        const SignalController &signals,
                                                        IRandomSource &random) const
    {
        const LaneOccupancy occupancy = buildOccupancy();

        std::vector<CarDecision> decisions;
        decisions.reserve(car_list.size());
        for (size_t i = 0; i < car_list.size(); ++i)
        {
            decisions.push_back(decide(i, occupancy, network, signals, random));
        }
        return decisions;
    }

    void CarFlowSimulator::recycle(Car &car, const RoadNetwork &network, IRandomSource &random) const
    {
        const auto &roads = network.roadLaneIds();
        car.t = 0.0;
        car.lane = roads.at(random.pickIndex(roads.size()));
        car.target_lane.reset();
    }

    void CarFlowSimulator::advanceAcrossLaneEnds(Car &car, const RoadNetwork &network, IRandomSource &random, FlowTickStats &stats) const
    {
        while (car.t >= network.lane(car.lane).length())
        {
            if (!car.target_lane)
            {
                recycle(car, network, random);
                stats.recycled++;
                return;
            }

            car.t -= network.lane(car.lane).length();
            car.lane = *car.target_lane;
            car.target_lane.reset();
            stats.lane_transitions++;
        }
    }

    FlowTickStats CarFlowSimulator::integrate(const RoadNetwork &network,
                                              const std::vector<CarDecision> &decisions,
                                              double dt_seconds,
                                              IRandomSource &random)
    {
        FlowTickStats stats;
        const size_t count = std::min(decisions.size(), car_list.size());

        for (size_t i = 0; i < count; ++i)
        {
            Car &car = car_list[i];
            const CarDecision &decision = decisions[i];

            if (decision.target_lane && !car.target_lane)
            {
                car.target_lane = decision.target_lane;
            }

            if (decision.emergency_stop)
            {
                car.a = decision.acceleration;
                car.v = 0.0;
                stats.emergency_stops++;
            }
            else
            {
                double acceleration = decision.acceleration;
                if (car.v == 0.0 && acceleration < 0.0)
                {
                    acceleration = 0.0; // already stopped
                }
                car.a = acceleration;
                car.v = std::max(0.0, car.v + acceleration * dt_seconds);
                car.t += car.v * dt_seconds;
                advanceAcrossLaneEnds(car, network, random, stats);
            }

            car.flow_state = classifyFlow(car.a, car.v, config.traffic, config.driver.desired_speed);
        }

        return stats;
    }

    FlowTickStats CarFlowSimulator::step(const RoadNetwork &network,
                                         const SignalController &signals,
                                         double dt_seconds,
                                         IRandomSource &random)
    {
        const std::vector<CarDecision> decisions = perceive(network, signals, random);
        return integrate(network, decisions, dt_seconds, random);
    }

    double CarFlowSimulator::averageSpeed() const
    {
        if (car_list.empty())
        {
            return 0.0;
        }

        double total = 0.0;
        for (const auto &car : car_list)
        {
            total += car.v;
        }
        return total / static_cast<double>(car_list.size());
    }

    size_t CarFlowSimulator::countInState(FlowState state) const
    {
        return static_cast<size_t>(std::count_if(car_list.begin(), car_list.end(),
                                                 [state](const Car &car)
                                                 { return car.flow_state == state; }));
    }

} // namespace gridflow
