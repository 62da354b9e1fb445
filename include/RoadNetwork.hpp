#pragma once

#include "Geometry.hpp"
#include "GridConfig.hpp"
#include "Intersection.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gridflow
{
    using LaneId = uint32_t;
    using NodeId = uint32_t;

    constexpr NodeId NO_NODE = std::numeric_limits<NodeId>::max();

    enum class LaneKind : uint8_t
    {
        Road,
        Junction
    };

    struct Lane
    {
        LaneId id = 0;
        std::string name;
        LaneKind kind = LaneKind::Road;
        LaneCurve curve;
        std::vector<LaneId> next_lanes;
        std::vector<LaneId> prev_lanes;
        NodeId from_node = NO_NODE; // roads only
        NodeId to_node = NO_NODE;   // roads only
        ApproachAxis axis = ApproachAxis::NS;

        double length() const { return curve.length(); }
        bool isRoad() const { return kind == LaneKind::Road; }
    };

    struct IntersectionNode
    {
        NodeId id = 0;
        std::string name;
        uint16_t grid_x = 0;
        uint16_t grid_z = 0;
        Vec3 position;
    };

    // Directed lane graph. Lanes and nodes reference each other by index only;
    // lookups of unknown ids throw std::out_of_range.
    class RoadNetwork
    {
    public:
        NodeId addNode(uint16_t grid_x, uint16_t grid_z, const Vec3 &position);
        LaneId addRoadLane(NodeId from, NodeId to, ApproachAxis axis, const LaneCurve &curve);
        LaneId addJunctionLane(LaneId in_lane, LaneId out_lane, const LaneCurve &curve);

        const Lane &lane(LaneId id) const;
        const IntersectionNode &node(NodeId id) const;

        const std::vector<Lane> &lanes() const { return lane_table; }
        const std::vector<IntersectionNode> &nodes() const { return node_table; }
        const std::vector<LaneId> &roadLaneIds() const { return road_lane_ids; }

        std::size_t laneCount() const { return lane_table.size(); }
        std::size_t nodeCount() const { return node_table.size(); }
        std::size_t junctionLaneCount() const { return lane_table.size() - road_lane_ids.size(); }

        std::optional<LaneId> findLane(const std::string &name) const;
        std::optional<NodeId> findNode(uint16_t grid_x, uint16_t grid_z) const;

    private:
        std::vector<Lane> lane_table;
        std::vector<IntersectionNode> node_table;
        std::vector<LaneId> road_lane_ids;
        std::unordered_map<std::string, LaneId> lanes_by_name;
    };

    // True when a car leaving `in_lane` may enter `out_lane`: the turn between the
    // end tangent of one and the start tangent of the other stays within the limit.
    bool isTurnAllowed(const Lane &in_lane, const Lane &out_lane, double max_turn_angle_ratio);

    // Builds the G x G grid: roads between adjacent nodes in both directions, then
    // one junction connector for every permitted turn at every node.
    RoadNetwork buildGridNetwork(const NetworkConfig &config);

} // namespace gridflow
