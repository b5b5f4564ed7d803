/***
 * The simplified Independent LFR model.
 */
#ifndef MLL_ILFRS_HPP
#define MLL_ILFRS_HPP

#include "model/quality_model.hpp"

/// Distance kept between mu and the ends of (0, 1).
static const double ILFRS_EPSILON = 1e-7;

/// A fraction mu of every vertex's degree is spent on edges leaving its community. The log-likelihood,
///     Eout log(mu) + Ein log(1 - mu) - Eout log(2E) - sum_c in_c log(D_c) - E + sum_v d_v log(d_v),
/// is also the objective of the local search.
class ILFRs : public IQualityModel {
public:
    double remove_gain(const CommunityAggregates &aggregates, long vertex, double weight_to_community,
                       const ModelContext &context, double parameter) const override;
    double insert_gain(const CommunityAggregates &aggregates, long vertex, long community, double weight_to_community,
                       const ModelContext &context, double parameter) const override;
    double quality(const PartitionStatistics &statistics, double parameter) const override;
    double log_likelihood(const PartitionStatistics &statistics, double parameter) const override;
    /// mu = Eout / E
    double estimate_parameter(const PartitionStatistics &statistics, const IMinimizer &minimizer) const override;
    ModelType type() const override { return ModelType::ILFRs; }
    std::string parameter_name() const override { return "mu"; }
    std::string domain() const override { return "(0, 1)"; }
    double default_parameter() const override { return 0.5; }
    bool is_valid(double parameter) const override;
    double clamp(double parameter) const override;
};

#endif // MLL_ILFRS_HPP
