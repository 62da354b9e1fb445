#include "RoadNetwork.hpp"

#include <cmath>
#include <stdexcept>

namespace gridflow
{
    namespace
    {
        constexpr double PI = 3.14159265358979323846;

        std::string nodeName(uint16_t grid_x, uint16_t grid_z)
        {
            return std::to_string(grid_x) + "_" + std::to_string(grid_z);
        }
    }

    NodeId RoadNetwork::addNode(uint16_t grid_x, uint16_t grid_z, const Vec3 &position)
    {
        IntersectionNode entry;
        entry.id = static_cast<NodeId>(node_table.size());
        entry.name = nodeName(grid_x, grid_z);
        entry.grid_x = grid_x;
        entry.grid_z = grid_z;
        entry.position = position;
        node_table.push_back(entry);
        return entry.id;
    }

    LaneId RoadNetwork::addRoadLane(NodeId from, NodeId to, ApproachAxis axis, const LaneCurve &curve)
    {
        Lane entry;
        entry.id = static_cast<LaneId>(lane_table.size());
        entry.name = "R_" + node(from).name + "_" + node(to).name;
        entry.kind = LaneKind::Road;
        entry.curve = curve;
        entry.from_node = from;
        entry.to_node = to;
        entry.axis = axis;

        if (!lanes_by_name.emplace(entry.name, entry.id).second)
        {
            throw std::invalid_argument("duplicate lane " + entry.name);
        }
        road_lane_ids.push_back(entry.id);
        lane_table.push_back(std::move(entry));
        return lane_table.back().id;
    }

    LaneId RoadNetwork::addJunctionLane(LaneId in_lane, LaneId out_lane, const LaneCurve &curve)
    {
        Lane entry;
        entry.id = static_cast<LaneId>(lane_table.size());
        entry.name = "J_" + lane(in_lane).name + "_" + lane(out_lane).name;
        entry.kind = LaneKind::Junction;
        entry.curve = curve;
        entry.prev_lanes.push_back(in_lane);
        entry.next_lanes.push_back(out_lane);
        entry.axis = lane(in_lane).axis;

        if (!lanes_by_name.emplace(entry.name, entry.id).second)
        {
            throw std::invalid_argument("duplicate lane " + entry.name);
        }
        const LaneId id = entry.id;
        lane_table.push_back(std::move(entry));
        lane_table.at(in_lane).next_lanes.push_back(id);
        lane_table.at(out_lane).prev_lanes.push_back(id);
        return id;
    }

    const Lane &RoadNetwork::lane(LaneId id) const
    {
        return lane_table.at(id);
    }

    const IntersectionNode &RoadNetwork::node(NodeId id) const
    {
        return node_table.at(id);
    }

    std::optional<LaneId> RoadNetwork::findLane(const std::string &name) const
    {
        auto it = lanes_by_name.find(name);
        if (it == lanes_by_name.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<NodeId> RoadNetwork::findNode(uint16_t grid_x, uint16_t grid_z) const
    {
        for (const auto &entry : node_table)
        {
            if (entry.grid_x == grid_x && entry.grid_z == grid_z)
            {
                return entry.id;
            }
        }
        return std::nullopt;
    }

    bool isTurnAllowed(const Lane &in_lane, const Lane &out_lane, double max_turn_angle_ratio)
    {
        const double angle = angleBetween(in_lane.curve.endTangent(), out_lane.curve.startTangent());
        return angle <= PI * max_turn_angle_ratio;
    }

    RoadNetwork buildGridNetwork(const NetworkConfig &config)
    {
        RoadNetwork network;
        const uint16_t size = config.grid_size;
        const double half = (static_cast<double>(size) - 1.0) / 2.0;
        const double width = config.road_width;
        const double offset = config.lane_offset;

        auto nodePosition = [&](uint16_t x, uint16_t z)
        {
            return Vec3{(x - half) * config.block_size, 0.0, (z - half) * config.block_size};
        };

        // Node ids follow x * size + z
        for (uint16_t x = 0; x < size; ++x)
        {
            for (uint16_t z = 0; z < size; ++z)
            {
                network.addNode(x, z, nodePosition(x, z));
            }
        }

        auto nodeAt = [size](uint16_t x, uint16_t z)
        {
            return static_cast<NodeId>(x) * size + z;
        };

        for (uint16_t x = 0; x < size; ++x)
        {
            for (uint16_t z = 0; z < size; ++z)
            {
                const Vec3 current = nodePosition(x, z);
                const NodeId current_id = nodeAt(x, z);

                if (x + 1 < size)
                {
                    const Vec3 next = nodePosition(x + 1, z);
                    const NodeId next_id = nodeAt(x + 1, z);
                    network.addRoadLane(current_id, next_id, ApproachAxis::EW,
                                        LaneCurve::line(current + Vec3{width, 0.0, offset},
                                                        next + Vec3{-width, 0.0, offset}));
                    network.addRoadLane(next_id, current_id, ApproachAxis::EW,
                                        LaneCurve::line(next + Vec3{-width, 0.0, -offset},
                                                        current + Vec3{width, 0.0, -offset}));
                }

                if (z + 1 < size)
                {
                    const Vec3 next = nodePosition(x, z + 1);
                    const NodeId next_id = nodeAt(x, z + 1);
                    network.addRoadLane(current_id, next_id, ApproachAxis::NS,
                                        LaneCurve::line(current + Vec3{-offset, 0.0, width},
                                                        next + Vec3{-offset, 0.0, -width}));
                    network.addRoadLane(next_id, current_id, ApproachAxis::NS,
                                        LaneCurve::line(next + Vec3{offset, 0.0, -width},
                                                        current + Vec3{offset, 0.0, width}));
                }
            }
        }

        // Outgoing roads per node, in lane id order
        const std::vector<LaneId> roads = network.roadLaneIds();
        std::vector<std::vector<LaneId>> roads_from(network.nodeCount());
        for (LaneId id : roads)
        {
            roads_from.at(network.lane(id).from_node).push_back(id);
        }

        const double control_distance = width * config.junction_control_scale;
        for (LaneId in_id : roads)
        {
            const NodeId via = network.lane(in_id).to_node;
            for (LaneId out_id : roads_from.at(via))
            {
                // addJunctionLane grows the lane table, so look lanes up again each pass
                const Lane &in_lane = network.lane(in_id);
                const Lane &out_lane = network.lane(out_id);
                if (!isTurnAllowed(in_lane, out_lane, config.max_turn_angle_ratio))
                {
                    continue;
                }

                const Vec3 start = in_lane.curve.endPoint();
                const Vec3 control = start + in_lane.curve.endTangent() * control_distance;
                const Vec3 end = out_lane.curve.startPoint();
                network.addJunctionLane(in_id, out_id, LaneCurve::quadraticBezier(start, control, end));
            }
        }

        return network;
    }

} // namespace gridflow
