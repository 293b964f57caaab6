#include "ionchannel/statistics/shapiro_wilk.hpp"
#include "ionchannel/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <string>

namespace ionchannel {

namespace {

// Coefficients in rational approximations
constexpr double QN_A[] = {-3.969683028665376e+01, 2.209460984245205e+02,
                           -2.759285104469687e+02, 1.383577518672690e+02,
                           -3.066479806614716e+01, 2.506628277459239e+00};

constexpr double QN_B[] = {-5.447609879822406e+01, 1.615858368580409e+02,
                           -1.556989798598866e+02, 6.680131188771972e+01,
                           -1.328068155288572e+01};

constexpr double QN_C[] = {-7.784894002430293e-03, -3.223964580411365e-01,
                           -2.400758277161838e+00, -2.549732539343734e+00,
                           4.374664141464968e+00,  2.938163982698783e+00};

constexpr double QN_D[] = {7.784695709041462e-03, 3.224671290700398e-01,
                           2.445134137142996e+00, 3.754408661907416e+00};

constexpr double QN_LOW = 0.02425;
constexpr double QN_HIGH = 0.97575;

// AS R94 polynomial coefficients
constexpr double SW_C1[] = {0.0, 0.221157, -0.147981, -2.07119, 4.434685, -2.706056};
constexpr double SW_C2[] = {0.0, 0.042981, -0.293762, -1.752461, 5.682633, -3.582633};
constexpr double SW_C3[] = {0.544, -0.39978, 0.025054, -6.714e-4};
constexpr double SW_C4[] = {1.3822, -0.77857, 0.062767, -0.0020322};
constexpr double SW_C5[] = {-1.5861, -0.31082, -0.083751, 0.0038915};
constexpr double SW_C6[] = {-0.4803, -0.082676, 0.0030302};
constexpr double SW_G[] = {-2.273, 0.459};

constexpr size_t SW_MIN_N = 3;
constexpr size_t SW_MAX_N = 5000;

/// c[0] + c[1] x + c[2] x^2 + ...
template <size_t N> double poly(const double (&c)[N], double x) {
  double result = c[N - 1];
  for (size_t i = N - 1; i > 0; --i) {
    result = result * x + c[i - 1];
  }
  return result;
}

} // namespace

double normal_quantile(double p) {
  if (p < 0.0 || p > 1.0 || std::isnan(p)) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  if (p == 0.0) {
    return -std::numeric_limits<double>::infinity();
  }
  if (p == 1.0) {
    return std::numeric_limits<double>::infinity();
  }

  if (p < QN_LOW) {
    // Lower region
    const double q = std::sqrt(-2.0 * std::log(p));
    return (((((QN_C[0] * q + QN_C[1]) * q + QN_C[2]) * q + QN_C[3]) * q +
             QN_C[4]) * q + QN_C[5]) /
           ((((QN_D[0] * q + QN_D[1]) * q + QN_D[2]) * q + QN_D[3]) * q + 1.0);
  }
  if (p > QN_HIGH) {
    // Upper region
    const double q = std::sqrt(-2.0 * std::log(1.0 - p));
    return -(((((QN_C[0] * q + QN_C[1]) * q + QN_C[2]) * q + QN_C[3]) * q +
              QN_C[4]) * q + QN_C[5]) /
           ((((QN_D[0] * q + QN_D[1]) * q + QN_D[2]) * q + QN_D[3]) * q + 1.0);
  }

  // Central region
  const double q = p - 0.5;
  const double r = q * q;
  return (((((QN_A[0] * r + QN_A[1]) * r + QN_A[2]) * r + QN_A[3]) * r +
           QN_A[4]) * r + QN_A[5]) * q /
         (((((QN_B[0] * r + QN_B[1]) * r + QN_B[2]) * r + QN_B[3]) * r +
           QN_B[4]) * r + 1.0);
}

double normal_upper_tail(double z) {
  return 0.5 * std::erfc(z / std::sqrt(2.0));
}

double normal_pdf(double x, double mean, double std_dev) {
  const double z = (x - mean) / std_dev;
  return std::exp(-0.5 * z * z) / (std_dev * std::sqrt(2.0 * std::numbers::pi));
}

ShapiroWilkResult shapiro_wilk(std::vector<double> sample) {
  const size_t n = sample.size();
  if (n < SW_MIN_N || n > SW_MAX_N) {
    throw InvalidInputError("Shapiro-Wilk needs 3 to 5000 observations, got " +
                            std::to_string(n));
  }

  std::sort(sample.begin(), sample.end());
  const double range = sample.back() - sample.front();
  if (!(range > 0.0)) {
    throw InvalidInputError("Shapiro-Wilk sample has zero range");
  }

  const double an = static_cast<double>(n);
  const size_t half = n / 2;

  // Coefficients for the lower half, a[0] is the largest
  std::vector<double> a(half);
  if (n == 3) {
    a[0] = std::sqrt(0.5);
  } else {
    const double an25 = an + 0.25;
    double summ2 = 0.0;
    for (size_t i = 0; i < half; ++i) {
      a[i] = normal_quantile((static_cast<double>(i + 1) - 0.375) / an25);
      summ2 += a[i] * a[i];
    }
    summ2 *= 2.0;
    const double ssumm2 = std::sqrt(summ2);
    const double rsn = 1.0 / std::sqrt(an);
    const double a1 = poly(SW_C1, rsn) - a[0] / ssumm2;

    size_t first_scaled = 1;
    double fac = 0.0;
    if (n > 5) {
      first_scaled = 2;
      const double a2 = -a[1] / ssumm2 + poly(SW_C2, rsn);
      fac = std::sqrt((summ2 - 2.0 * a[0] * a[0] - 2.0 * a[1] * a[1]) /
                      (1.0 - 2.0 * a1 * a1 - 2.0 * a2 * a2));
      a[1] = a2;
    } else {
      fac = std::sqrt((summ2 - 2.0 * a[0] * a[0]) / (1.0 - 2.0 * a1 * a1));
    }
    a[0] = a1;
    for (size_t i = first_scaled; i < half; ++i) {
      a[i] = -a[i] / fac;
    }
  }

  double mean = 0.0;
  for (double x : sample) {
    mean += x;
  }
  mean /= an;

  double ssq = 0.0;
  for (double x : sample) {
    ssq += (x - mean) * (x - mean);
  }
  if (!(ssq > 0.0)) {
    throw InvalidInputError("Shapiro-Wilk sample has zero variance");
  }

  double numerator = 0.0;
  for (size_t i = 0; i < half; ++i) {
    numerator += a[i] * (sample[n - 1 - i] - sample[i]);
  }
  const double w = std::min(1.0, numerator * numerator / ssq);

  if (n == 3) {
    // Exact for n = 3
    constexpr double pi6 = 1.90985931710274;  // 6 / pi
    constexpr double stqr = 1.04719755119660; // asin(sqrt(3/4))
    const double p = pi6 * (std::asin(std::sqrt(w)) - stqr);
    return ShapiroWilkResult(w, std::clamp(p, 0.0, 1.0));
  }

  if (w >= 1.0) {
    return ShapiroWilkResult(w, 1.0);
  }

  const double w1 = std::log(1.0 - w);
  double y = 0.0;
  double m = 0.0;
  double s = 0.0;
  if (n <= 11) {
    const double gamma = poly(SW_G, an);
    if (w1 >= gamma) {
      return ShapiroWilkResult(w, 1e-99);
    }
    y = -std::log(gamma - w1);
    m = poly(SW_C3, an);
    s = std::exp(poly(SW_C4, an));
  } else {
    const double xx = std::log(an);
    y = w1;
    m = poly(SW_C5, xx);
    s = std::exp(poly(SW_C6, xx));
  }

  return ShapiroWilkResult(w, normal_upper_tail((y - m) / s));
}

} // namespace ionchannel
