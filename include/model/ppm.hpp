/***
 * The Planted Partition Model.
 */
#ifndef MLL_PPM_HPP
#define MLL_PPM_HPP

#include "model/quality_model.hpp"

/// Smallest pair count or edge rate that may enter a logarithm, and smallest admissible gamma.
static const double PPM_EPSILON = 1e-7;

/// Every pair of vertices is linked with rate p_in if both lie in the same community, and p_out otherwise.
/// At fixed gamma the model is optimized through the generalized modularity (Ein - gamma * P2in * E / P2) / E,
/// where P2 is the number of vertex pairs and P2in the number of intra-community pairs.
class PPM : public IQualityModel {
public:
    double remove_gain(const CommunityAggregates &aggregates, long vertex, double weight_to_community,
                       const ModelContext &context, double parameter) const override;
    double insert_gain(const CommunityAggregates &aggregates, long vertex, long community, double weight_to_community,
                       const ModelContext &context, double parameter) const override;
    double quality(const PartitionStatistics &statistics, double parameter) const override;
    /// Profile log-likelihood: p_in and p_out are set to their maximum likelihood estimates for the partition, so
    /// the value does not depend on `parameter`.
    double log_likelihood(const PartitionStatistics &statistics, double parameter) const override;
    double estimate_parameter(const PartitionStatistics &statistics, const IMinimizer &minimizer) const override;
    ModelType type() const override { return ModelType::PPM; }
    std::string parameter_name() const override { return "gamma"; }
    std::string domain() const override { return "(0, inf)"; }
    double default_parameter() const override { return 1.0; }
    bool is_valid(double parameter) const override;
    double clamp(double parameter) const override;
};

#endif // MLL_PPM_HPP
