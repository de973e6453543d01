#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>

#include <QElapsedTimer>
#include <QList>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrent>

#include "curvesimp/curve_simplifier.hpp"

namespace {

double g_target_similarity = 0.995;

curvesimp::CurveData make_curve(std::size_t seed, std::size_t rows) {
    curvesimp::CurveData curve;
    curve.x.reserve(rows);
    curve.y.reserve(rows);

    const double center = 0.2 + 0.6 * static_cast<double>(seed % 17) / 16.0;
    const double steepness = 8.0 + static_cast<double>(seed % 5) * 6.0;
    for (std::size_t i = 0; i < rows; ++i) {
        const double x = static_cast<double>(i) / static_cast<double>(rows - 1);
        const double ripple = 0.001 * std::sin(static_cast<double>(i + seed) * 0.91);
        curve.x.push_back(x);
        curve.y.push_back(1.0 / (1.0 + std::exp(-(x - center) * steepness)) + ripple);
    }
    return curve;
}

// One simplifier per task: the cached tolerance is specific to the curve it was
// resolved on and must not be shared across threads.
curvesimp::SimplifyResult simplify_one(const curvesimp::CurveData& curve) {
    curvesimp::CurveSimplifier simplifier(g_target_similarity);
    return simplifier.simplify(curve);
}

} // namespace

int main(int argc, char** argv) {
    const std::size_t curve_count = (argc > 1) ? static_cast<std::size_t>(std::strtoull(argv[1], nullptr, 10)) : 64;
    const std::size_t rows = (argc > 2) ? static_cast<std::size_t>(std::strtoull(argv[2], nullptr, 10)) : 2000;
    g_target_similarity = (argc > 3) ? std::atof(argv[3]) : 0.995;

    if (curve_count == 0 || rows < 3) {
        std::cerr << "require curve_count > 0 and rows >= 3\n";
        return 1;
    }

    QList<curvesimp::CurveData> curves;
    curves.reserve(static_cast<int>(curve_count));
    for (std::size_t i = 0; i < curve_count; ++i) {
        curves.append(make_curve(i, rows));
    }

    QElapsedTimer timer;
    timer.start();
    const QList<curvesimp::SimplifyResult> results =
        QtConcurrent::blockingMapped<QList<curvesimp::SimplifyResult>>(curves, simplify_one);
    const qint64 elapsed_ms = timer.elapsed();

    std::size_t kept_total = 0;
    std::size_t failures = 0;
    std::size_t best_effort = 0;
    double min_similarity = 1.0;
    for (const curvesimp::SimplifyResult& result : results) {
        if (!result.success) {
            ++failures;
            std::cerr << "Simplification failed: " << result.error << "\n";
            continue;
        }
        kept_total += result.curve.size();
        if (!result.warnings.empty()) {
            ++best_effort;
        }
        min_similarity = std::min(min_similarity, result.similarity);
    }

    std::cout << "Curves: " << curve_count << " x " << rows << " points\n";
    std::cout << "Threads: " << QThreadPool::globalInstance()->maxThreadCount() << "\n";
    std::cout << "Elapsed ms: " << elapsed_ms << "\n";
    std::cout << "Kept points (total): " << kept_total << " of " << curve_count * rows << "\n";
    std::cout << "Best-effort searches: " << best_effort << "\n";
    std::cout << "Min similarity: " << min_similarity << "\n";
    return failures == 0 ? 0 : 1;
}
