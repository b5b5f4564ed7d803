#include "model/quality_model.hpp"

#include <algorithm>
#include <cctype>

#include "exceptions.hpp"
#include "model/dcppm.hpp"
#include "model/ilfr.hpp"
#include "model/ilfrs.hpp"
#include "model/ppm.hpp"

double IQualityModel::move_gain(const CommunityAggregates &aggregates, long vertex, long community,
                                const ModelContext &context, double parameter) const {
    long current = aggregates.community(vertex);
    if (community == current) return 0.0;
    NeighborCommunities neighbors = aggregates.neighbor_communities(vertex);
    double gain = 0.0;
    if (current >= 0) {
        gain += this->remove_gain(aggregates, vertex, neighbors.weight(current), context, parameter);
    }
    return gain + this->insert_gain(aggregates, vertex, community, neighbors.weight(community), context, parameter);
}

namespace model {

std::unique_ptr<IQualityModel> make(ModelType type) {
    switch (type) {
        case ModelType::PPM:
            return std::unique_ptr<IQualityModel>(new PPM());
        case ModelType::DCPPM:
            return std::unique_ptr<IQualityModel>(new DCPPM());
        case ModelType::ILFR:
            return std::unique_ptr<IQualityModel>(new ILFR());
        case ModelType::ILFRs:
            return std::unique_ptr<IQualityModel>(new ILFRs());
    }
    throw ConfigurationError("unhandled model type");
}

std::string name(ModelType type) {
    switch (type) {
        case ModelType::PPM: return "ppm";
        case ModelType::DCPPM: return "dcppm";
        case ModelType::ILFR: return "ilfr";
        case ModelType::ILFRs: return "ilfrs";
    }
    throw ConfigurationError("unhandled model type");
}

ModelType parse(const std::string &name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "ppm") return ModelType::PPM;
    if (lower == "dcppm") return ModelType::DCPPM;
    if (lower == "ilfr") return ModelType::ILFR;
    if (lower == "ilfrs") return ModelType::ILFRs;
    throw ConfigurationError("unknown model '" + name + "', expected one of ppm|dcppm|ilfr|ilfrs");
}

}  // namespace model
