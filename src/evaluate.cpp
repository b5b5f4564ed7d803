#include "evaluate.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "aggregation.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

namespace evaluate {

Comparison compare_partitions(const Assignment &lhs, const Assignment &rhs) {
    if (lhs.size() != rhs.size()) {
        throw ValidationError("cannot compare partitions of " + std::to_string(lhs.size()) + " and "
                              + std::to_string(rhs.size()) + " vertices");
    }
    Assignment rows = aggregation::renumber(lhs);
    Assignment cols = aggregation::renumber(rhs);
    long nrows = aggregation::num_communities(rows);
    long ncols = aggregation::num_communities(cols);
    // Contingency table, stored sparsely
    std::vector<MapVector<long>> contingency_table(nrows);
    std::vector<double> rowsums = utils::constant<double>(nrows, 0.0);
    std::vector<double> colsums = utils::constant<double>(ncols, 0.0);
    for (size_t vertex = 0; vertex < rows.size(); ++vertex) {
        contingency_table[rows[vertex]][cols[vertex]] += 1;
        rowsums[rows[vertex]] += 1.0;
        colsums[cols[vertex]] += 1.0;
    }
    double num_vertices = double(lhs.size());
    Comparison result;
    if (num_vertices < 2.0) {
        result.rand = 1.0;
        result.jaccard = 1.0;
        result.nmi = 1.0;
        return result;
    }
    // The number of vertex pairs = |V| choose 2
    double num_pairs = num_vertices * (num_vertices - 1.0) / 2.0;
    double cell_pairs = 0.0;  // pairs together in both partitions
    double mutual_information = 0.0;
    for (long row = 0; row < nrows; ++row) {
        for (const auto &cell : contingency_table[row]) {
            double value = double(cell.second);
            cell_pairs += value * (value - 1.0) / 2.0;
            mutual_information += value / num_vertices
                                  * std::log(value * num_vertices / (rowsums[row] * colsums[cell.first]));
        }
    }
    double row_pairs = 0.0;  // pairs together in lhs
    double row_entropy = 0.0;
    for (double sum : rowsums) {
        row_pairs += sum * (sum - 1.0) / 2.0;
        row_entropy -= utils::xlogy(sum / num_vertices, sum / num_vertices);
    }
    double col_pairs = 0.0;  // pairs together in rhs
    double col_entropy = 0.0;
    for (double sum : colsums) {
        col_pairs += sum * (sum - 1.0) / 2.0;
        col_entropy -= utils::xlogy(sum / num_vertices, sum / num_vertices);
    }
    double num_agreement = num_pairs + 2.0 * cell_pairs - row_pairs - col_pairs;
    result.rand = num_agreement / num_pairs;
    double together = row_pairs + col_pairs - cell_pairs;
    result.jaccard = (together > 0.0) ? cell_pairs / together : 1.0;
    if (row_entropy > 0.0 && col_entropy > 0.0) {
        result.nmi = mutual_information / std::sqrt(row_entropy * col_entropy);
    } else {
        // A partition with a single community carries no information
        result.nmi = (row_entropy == col_entropy) ? 1.0 : 0.0;
    }
    return result;
}

Assignment load_truth(const fs::path &filepath, long num_vertices) {
    std::vector<std::vector<std::string>> csv_contents = utils::read_csv(filepath);
    Assignment assignment = utils::constant<long>(num_vertices, -1);
    for (const std::vector<std::string> &line : csv_contents) {
        if (line.size() < 2) throw ValidationError("every truth line needs a vertex and a community");
        long vertex = std::stol(line[0]) - 1;  // Truth storage format indices vertices from 1, not 0
        long community = std::stol(line[1]);
        if (vertex < 0 || vertex >= num_vertices) {
            throw ValidationError("truth vertex " + line[0] + " is not in the graph");
        }
        assignment[vertex] = community;
    }
    for (long vertex = 0; vertex < num_vertices; ++vertex) {
        if (assignment[vertex] < 0) {
            throw ValidationError("truth has no valid community for vertex " + std::to_string(vertex + 1));
        }
    }
    return aggregation::renumber(assignment);
}

}  // namespace evaluate
