/***
 * The Degree-Corrected Planted Partition Model.
 */
#ifndef MLL_DCPPM_HPP
#define MLL_DCPPM_HPP

#include "model/quality_model.hpp"

/// Smallest edge rate that may enter a logarithm, and smallest admissible gamma.
static const double DCPPM_EPSILON = 1e-7;

/// Vertices i and j are linked with rate p * d_i * d_j / 2E, with p = p_in inside communities and p_out across.
/// At fixed gamma the model is optimized through the generalized modularity Ein / E - gamma * sum_c D_c^2 / 4E^2,
/// which is Newman-Girvan modularity when gamma = 1.
class DCPPM : public IQualityModel {
public:
    double remove_gain(const CommunityAggregates &aggregates, long vertex, double weight_to_community,
                       const ModelContext &context, double parameter) const override;
    double insert_gain(const CommunityAggregates &aggregates, long vertex, long community, double weight_to_community,
                       const ModelContext &context, double parameter) const override;
    double quality(const PartitionStatistics &statistics, double parameter) const override;
    /// Profile log-likelihood, evaluated at the maximum likelihood p_in and p_out of the partition.
    double log_likelihood(const PartitionStatistics &statistics, double parameter) const override;
    double estimate_parameter(const PartitionStatistics &statistics, const IMinimizer &minimizer) const override;
    ModelType type() const override { return ModelType::DCPPM; }
    std::string parameter_name() const override { return "gamma"; }
    std::string domain() const override { return "(0, inf)"; }
    double default_parameter() const override { return 1.0; }
    bool is_valid(double parameter) const override;
    double clamp(double parameter) const override;
};

#endif // MLL_DCPPM_HPP
