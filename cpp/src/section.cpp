#include "steelcheck/section.hpp"
#include "steelcheck/errors.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace steelcheck {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Relative deviation tolerated between catalog and derived radii
constexpr double kRadiusTolerance = 0.02;

/**
 * @brief Axis-aligned rectangle of a plate assembly [mm]
 */
struct Rect {
    double x0;  ///< Left edge
    double y0;  ///< Bottom edge
    double w;   ///< Width (along x)
    double h;   ///< Height (along y)
};

/**
 * @brief Bending properties of a plate assembly about one centroidal axis
 */
struct AxisProperties {
    double I = 0.0;  ///< Second moment of area
    double S = 0.0;  ///< Elastic modulus (to the farthest fibre)
    double Z = 0.0;  ///< Plastic modulus
};

// ∫|s - sp| ds over [a, b]
double abs_first_moment(double a, double b, double sp) {
    if (sp <= a) {
        return ((b - sp) * (b - sp) - (a - sp) * (a - sp)) / 2.0;
    }
    if (sp >= b) {
        return ((sp - a) * (sp - a) - (sp - b) * (sp - b)) / 2.0;
    }
    return ((sp - a) * (sp - a) + (b - sp) * (b - sp)) / 2.0;
}

/**
 * @brief Integrate I, S and Z of rectangles about a horizontal axis
 *
 * With about_x = true the coordinate across the axis is y (major-axis
 * bending); otherwise x is used and the rectangles are read transposed.
 * The plastic neutral axis is located by bisection on the equal-area
 * condition.
 */
AxisProperties integrate_axis(const std::vector<Rect>& rects, bool about_x) {
    struct Strip { double s0; double len; double breadth; };
    std::vector<Strip> strips;
    strips.reserve(rects.size());
    for (const auto& r : rects) {
        if (about_x) {
            strips.push_back({r.y0, r.h, r.w});
        } else {
            strips.push_back({r.x0, r.w, r.h});
        }
    }

    double area = 0.0;
    double first = 0.0;
    double s_min = strips.front().s0;
    double s_max = strips.front().s0 + strips.front().len;
    for (const auto& st : strips) {
        double a = st.breadth * st.len;
        area += a;
        first += a * (st.s0 + st.len / 2.0);
        s_min = std::min(s_min, st.s0);
        s_max = std::max(s_max, st.s0 + st.len);
    }
    double sc = first / area;

    AxisProperties props;
    for (const auto& st : strips) {
        double a = st.breadth * st.len;
        double dc = st.s0 + st.len / 2.0 - sc;
        props.I += st.breadth * st.len * st.len * st.len / 12.0 + a * dc * dc;
    }
    double c = std::max(sc - s_min, s_max - sc);
    props.S = props.I / c;

    auto area_below = [&strips](double s) {
        double sum = 0.0;
        for (const auto& st : strips) {
            sum += st.breadth * std::clamp(s - st.s0, 0.0, st.len);
        }
        return sum;
    };

    double lo = s_min;
    double hi = s_max;
    for (int iter = 0; iter < 200; ++iter) {
        double mid = 0.5 * (lo + hi);
        if (area_below(mid) < area / 2.0) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    double sp = 0.5 * (lo + hi);

    for (const auto& st : strips) {
        props.Z += st.breadth * abs_first_moment(st.s0, st.s0 + st.len, sp);
    }
    return props;
}

double total_area(const std::vector<Rect>& rects) {
    double area = 0.0;
    for (const auto& r : rects) area += r.w * r.h;
    return area;
}

double unit_weight(double A) {
    return A * 1e-6 * SteelSection::kSteelDensity;
}

SteelSection from_rectangles(const std::string& id, SectionType type, CatalogOrigin origin,
                             const std::vector<Rect>& rects) {
    AxisProperties px = integrate_axis(rects, true);
    AxisProperties py = integrate_axis(rects, false);
    SteelSection sec(id, type, origin, total_area(rects), px.I, py.I);
    sec.set_moduli(px.S, py.S, px.Z, py.Z);
    sec.weight = unit_weight(sec.A);
    return sec;
}

void require_positive(const std::string& field, double value) {
    if (!(value > 0.0)) {
        throw CheckException(CheckError::invalid_property(field, value, field + " must be positive"));
    }
}

} // namespace

std::string section_type_to_string(SectionType type) {
    switch (type) {
        case SectionType::WideFlange: return "W";
        case SectionType::RectangularHollow: return "HSS_RECT";
        case SectionType::RoundHollow: return "HSS_ROUND";
        case SectionType::Channel: return "C";
        case SectionType::Angle: return "L";
        default: return "UNKNOWN";
    }
}

SectionType parse_section_type(const std::string& tag) {
    if (tag == "W") return SectionType::WideFlange;
    if (tag == "HSS_RECT") return SectionType::RectangularHollow;
    if (tag == "HSS_ROUND") return SectionType::RoundHollow;
    if (tag == "C") return SectionType::Channel;
    if (tag == "L") return SectionType::Angle;
    throw CheckException(CheckError::unsupported("section_type", tag,
        "section type must be one of W, HSS_RECT, HSS_ROUND, C, L"));
}

std::string catalog_origin_to_string(CatalogOrigin origin) {
    return origin == CatalogOrigin::AISC ? "AISC" : "CHILEAN";
}

SteelSection::SteelSection(std::string id, SectionType type, CatalogOrigin origin,
                           double A, double Ix, double Iy)
    : id(std::move(id)), type(type), origin(origin), A(A), Ix(Ix), Iy(Iy) {
}

void SteelSection::set_plate_dimensions(double d, double bf, double tf, double tw) {
    this->d = d;
    this->bf = bf;
    this->tf = tf;
    this->tw = tw;
}

void SteelSection::set_moduli(double Sx, double Sy, double Zx, double Zy) {
    this->Sx = Sx;
    this->Sy = Sy;
    this->Zx = Zx;
    this->Zy = Zy;
}

void SteelSection::set_torsion(double J, double Cw) {
    this->J = J;
    this->Cw = Cw;
}

double SteelSection::rx() const {
    return std::sqrt(Ix / A);
}

double SteelSection::ry() const {
    return std::sqrt(Iy / A);
}

bool SteelSection::is_closed() const {
    return type == SectionType::RectangularHollow || type == SectionType::RoundHollow;
}

WarningList SteelSection::validate() const {
    require_positive("A", A);
    require_positive("Ix", Ix);
    require_positive("Iy", Iy);
    require_positive("Sx", Sx);
    require_positive("Zx", Zx);
    require_positive("d", d);

    switch (type) {
        case SectionType::WideFlange:
        case SectionType::Channel:
            require_positive("bf", bf);
            require_positive("tf", tf);
            require_positive("tw", tw);
            if (tf * 2.0 >= d) {
                throw CheckException(CheckError::invalid_property("tf", tf,
                    "flanges overlap (2*tf >= d)"));
            }
            break;
        case SectionType::RectangularHollow:
            require_positive("bf", bf);
            require_positive("t", t);
            break;
        case SectionType::RoundHollow:
        case SectionType::Angle:
            require_positive("t", t);
            break;
    }

    WarningList warnings;
    if (catalog_rx > 0.0 && std::abs(catalog_rx - rx()) > kRadiusTolerance * rx()) {
        warnings.add(CheckWarning::inconsistent_radius(id, "x", catalog_rx, rx()));
    }
    if (catalog_ry > 0.0 && std::abs(catalog_ry - ry()) > kRadiusTolerance * ry()) {
        warnings.add(CheckWarning::inconsistent_radius(id, "y", catalog_ry, ry()));
    }
    return warnings;
}

SteelSection SteelSection::welded_i(const std::string& id, CatalogOrigin origin,
                                    double d, double bf, double tf, double tw) {
    require_positive("d", d);
    require_positive("bf", bf);
    require_positive("tf", tf);
    require_positive("tw", tw);

    double hw = d - 2.0 * tf;
    if (!(hw > 0.0)) {
        throw CheckException(CheckError::invalid_property("tf", tf, "flanges overlap (2*tf >= d)"));
    }

    std::vector<Rect> rects = {
        {0.0, 0.0, bf, tf},                       // bottom flange
        {(bf - tw) / 2.0, tf, tw, hw},            // web
        {0.0, d - tf, bf, tf}                     // top flange
    };

    SteelSection sec = from_rectangles(id, SectionType::WideFlange, origin, rects);
    sec.set_plate_dimensions(d, bf, tf, tw);

    double J = (2.0 * bf * tf * tf * tf + hw * tw * tw * tw) / 3.0;
    double ho = d - tf;
    double Cw = sec.Iy * ho * ho / 4.0;
    sec.set_torsion(J, Cw);
    return sec;
}

SteelSection SteelSection::channel(const std::string& id, CatalogOrigin origin,
                                   double d, double bf, double tf, double tw) {
    require_positive("d", d);
    require_positive("bf", bf);
    require_positive("tf", tf);
    require_positive("tw", tw);

    double hw = d - 2.0 * tf;
    if (!(hw > 0.0) || !(bf > tw)) {
        throw CheckException(CheckError::invalid_property("tf", tf, "inconsistent channel plates"));
    }

    std::vector<Rect> rects = {
        {0.0, 0.0, tw, d},                        // web, full depth
        {tw, 0.0, bf - tw, tf},                   // bottom flange
        {tw, d - tf, bf - tw, tf}                 // top flange
    };

    SteelSection sec = from_rectangles(id, SectionType::Channel, origin, rects);
    sec.set_plate_dimensions(d, bf, tf, tw);

    double J = (2.0 * bf * tf * tf * tf + hw * tw * tw * tw) / 3.0;

    // Thin-walled warping constant of a channel about its shear centre
    double b = bf - tw / 2.0;
    double h = d - tf;
    double Cw = tf * b * b * b * h * h / 12.0 *
                (3.0 * b * tf + 2.0 * h * tw) / (6.0 * b * tf + h * tw);
    sec.set_torsion(J, Cw);
    return sec;
}

SteelSection SteelSection::rectangular_hollow(const std::string& id, CatalogOrigin origin,
                                              double H, double B, double t) {
    require_positive("d", H);
    require_positive("bf", B);
    require_positive("t", t);
    if (!(2.0 * t < std::min(H, B))) {
        throw CheckException(CheckError::invalid_property("t", t, "wall thickness too large for the outer size"));
    }

    std::vector<Rect> rects = {
        {0.0, 0.0, B, t},                         // bottom wall
        {0.0, H - t, B, t},                       // top wall
        {0.0, t, t, H - 2.0 * t},                 // left wall
        {B - t, t, t, H - 2.0 * t}                // right wall
    };

    SteelSection sec = from_rectangles(id, SectionType::RectangularHollow, origin, rects);
    sec.d = H;
    sec.bf = B;
    sec.t = t;

    // Bredt-Batho thin-walled closed section, midline dimensions
    double bm = B - t;
    double hm = H - t;
    double J = 2.0 * t * bm * bm * hm * hm / (bm + hm);
    sec.set_torsion(J, 0.0);
    return sec;
}

SteelSection SteelSection::round_hollow(const std::string& id, CatalogOrigin origin,
                                        double OD, double t) {
    require_positive("d", OD);
    require_positive("t", t);
    if (!(2.0 * t < OD)) {
        throw CheckException(CheckError::invalid_property("t", t, "wall thickness too large for the diameter"));
    }

    double ID = OD - 2.0 * t;
    double A = kPi / 4.0 * (OD * OD - ID * ID);
    double I = kPi / 64.0 * (std::pow(OD, 4) - std::pow(ID, 4));
    double S = I / (OD / 2.0);
    double Z = (std::pow(OD, 3) - std::pow(ID, 3)) / 6.0;

    SteelSection sec(id, SectionType::RoundHollow, origin, A, I, I);
    sec.set_moduli(S, S, Z, Z);
    sec.set_torsion(2.0 * I, 0.0);
    sec.d = OD;
    sec.bf = OD;
    sec.t = t;
    sec.weight = unit_weight(A);
    return sec;
}

SteelSection SteelSection::equal_angle(const std::string& id, CatalogOrigin origin,
                                       double b, double t) {
    require_positive("b", b);
    require_positive("t", t);
    if (!(t < b)) {
        throw CheckException(CheckError::invalid_property("t", t, "leg thickness must be less than leg length"));
    }

    std::vector<Rect> rects = {
        {0.0, 0.0, t, b},                         // vertical leg
        {t, 0.0, b - t, t}                        // horizontal leg
    };

    SteelSection sec = from_rectangles(id, SectionType::Angle, origin, rects);
    sec.d = b;
    sec.bf = b;
    sec.t = t;

    double bm = b - t / 2.0;
    double J = 2.0 * bm * t * t * t / 3.0;
    double Cw = t * t * t / 36.0 * (2.0 * bm * bm * bm);
    sec.set_torsion(J, Cw);
    return sec;
}

} // namespace steelcheck
