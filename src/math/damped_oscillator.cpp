/**
 * @file damped_oscillator.cpp
 * @brief Closed-form solutions for the three damping regimes
 */

#include "motion/math/damped_oscillator.hpp"

#include <algorithm>
#include <cmath>

namespace Math {

namespace {

// |zeta - 1| below this is treated as critical damping
constexpr double CriticalTolerance = 1e-6;

bool isFinite(double v) {
    return std::isfinite(v);
}

} // namespace

DampedOscillator::DampedOscillator(double stiffness, double damping, double mass)
    : k(stiffness)
    , c(damping)
    , m(mass)
    , omega0(0.0)
    , zeta(0.0)
    , valid(false)
{
    valid = isFinite(k) && isFinite(c) && isFinite(m) &&
            k > 0.0 && m > 0.0 && c >= 0.0;

    if (valid) {
        omega0 = std::sqrt(k / m);
        zeta   = c / (2.0 * std::sqrt(k * m));
    }
}

DampedOscillator::Regime DampedOscillator::regime() const {
    if (std::fabs(zeta - 1.0) <= CriticalTolerance) {
        return Regime::CriticallyDamped;
    }
    return zeta < 1.0 ? Regime::Underdamped : Regime::Overdamped;
}

DampedOscillator::Response DampedOscillator::response(double t) const {
    if (!valid) {
        return {};
    }
    t = std::max(0.0, t);

    switch (regime()) {
        case Regime::Underdamped: {
            double const alpha = zeta * omega0;
            double const omegaD = omega0 * std::sqrt(1.0 - zeta * zeta);
            double const decay = std::exp(-alpha * t);
            double const cosT = std::cos(omegaD * t);
            double const sinT = std::sin(omegaD * t);
            return {decay * (cosT + (alpha / omegaD) * sinT),
                    decay * sinT / omegaD};
        }
        case Regime::CriticallyDamped: {
            double const decay = std::exp(-omega0 * t);
            return {decay * (1.0 + omega0 * t),
                    decay * t};
        }
        case Regime::Overdamped: {
            double const s  = std::sqrt(zeta * zeta - 1.0);
            double const r1 = -omega0 / (zeta + s);  // slow root
            double const r2 = -omega0 * (zeta + s);  // fast root
            double const d  = r1 - r2;
            double const e1 = std::exp(r1 * t);
            double const e2 = std::exp(r2 * t);
            return {(r1 * e2 - r2 * e1) / d,
                    (e1 - e2) / d};
        }
    }
    return {};
}

DampedOscillator::Response DampedOscillator::velocityResponse(double t) const {
    if (!valid) {
        return {};
    }
    t = std::max(0.0, t);

    switch (regime()) {
        case Regime::Underdamped: {
            double const alpha = zeta * omega0;
            double const omegaD = omega0 * std::sqrt(1.0 - zeta * zeta);
            double const decay = std::exp(-alpha * t);
            double const cosT = std::cos(omegaD * t);
            double const sinT = std::sin(omegaD * t);
            return {-decay * (omega0 * omega0 / omegaD) * sinT,
                    decay * (cosT - (alpha / omegaD) * sinT)};
        }
        case Regime::CriticallyDamped: {
            double const decay = std::exp(-omega0 * t);
            return {-omega0 * omega0 * t * decay,
                    decay * (1.0 - omega0 * t)};
        }
        case Regime::Overdamped: {
            double const s  = std::sqrt(zeta * zeta - 1.0);
            double const r1 = -omega0 / (zeta + s);
            double const r2 = -omega0 * (zeta + s);
            double const d  = r1 - r2;
            double const e1 = std::exp(r1 * t);
            double const e2 = std::exp(r2 * t);
            return {r1 * r2 * (e2 - e1) / d,
                    (r1 * e1 - r2 * e2) / d};
        }
    }
    return {};
}

double DampedOscillator::settlingDuration(double epsilon) const {
    if (!valid || epsilon >= 1.0) {
        return 0.0;
    }
    if (epsilon <= 0.0) {
        return MotionConstants::MaxSettlingDuration;
    }

    double const logEps = -std::log(epsilon);
    double duration = MotionConstants::MaxSettlingDuration;

    switch (regime()) {
        case Regime::Underdamped: {
            // Envelope of a released spring: e^(-alpha t) / sqrt(1 - zeta^2)
            double const alpha = zeta * omega0;
            if (alpha <= 0.0) {
                break;
            }
            double const amplitude = 1.0 / std::sqrt(1.0 - zeta * zeta);
            duration = (logEps + std::log(amplitude)) / alpha;
            break;
        }
        case Regime::CriticallyDamped: {
            // Solve e^(-w t)(1 + w t) = epsilon by fixed-point iteration
            double t = logEps / omega0;
            for (int i = 0; i < 32; ++i) {
                double const next = (logEps + std::log1p(omega0 * t)) / omega0;
                if (std::fabs(next - t) < 1e-9) {
                    t = next;
                    break;
                }
                t = next;
            }
            duration = t;
            break;
        }
        case Regime::Overdamped: {
            // The slow exponential dominates: r2/(r2 - r1) · e^(r1 t)
            double const s  = std::sqrt(zeta * zeta - 1.0);
            double const r1 = -omega0 / (zeta + s);
            double const r2 = -omega0 * (zeta + s);
            double const weight = r2 / (r2 - r1);
            duration = (logEps + std::log(weight)) / -r1;
            break;
        }
    }

    return std::clamp(duration, 0.0, MotionConstants::MaxSettlingDuration);
}

const char* toString(DampedOscillator::Regime regime) {
    switch (regime) {
        case DampedOscillator::Regime::Underdamped:      return "Underdamped";
        case DampedOscillator::Regime::CriticallyDamped: return "CriticallyDamped";
        case DampedOscillator::Regime::Overdamped:       return "Overdamped";
        default: return "Unknown";
    }
}

} // namespace Math
