#include "windloft_core/mesh/loft.hpp"

#include <cmath>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {
namespace wl = windloft::core;

bool near(const wl::Vec3& a, const wl::Vec3& b, const double tol = 1.0e-12) {
  return std::abs(a[0] - b[0]) <= tol && std::abs(a[1] - b[1]) <= tol &&
         std::abs(a[2] - b[2]) <= tol;
}

bool bracket_is(const wl::SectionBracket& b, const std::size_t in, const std::size_t out,
                const double weight) {
  return b.index_in == in && b.index_out == out && std::abs(b.weight - weight) < 1.0e-12;
}

wl::LoftDefinition plank() {
  const wl::Contour rectangle {{0.0, 0.0}, {1.0, 0.0}, {1.0, 0.1}, {0.0, 0.1}};
  wl::LoftDefinition def;
  def.bscale = 2.0;
  def.b_divisions = 2;
  def.chords = {{0.0, 0.5}, {1.0, 0.5}};
  def.twists = {{0.0, 0.0}, {1.0, 0.0}};
  def.le_x = {{0.0, 0.1}, {1.0, 0.1}};
  def.le_z = {{0.0, 0.0}, {1.0, 0.0}};
  def.sections = {{0.0, rectangle}, {1.0, rectangle}};
  return def;
}

bool rejects(const wl::LoftDefinition& def) {
  try {
    wl::validate_loft_definition(def);
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}
}  // namespace

int main() {
  const wl::Contour tri {{0.0, 0.0}, {1.0, 0.0}, {0.0, 1.0}};
  const std::vector<wl::CrossSection> sections {{0.0, tri}, {0.5, tri}, {1.0, tri}};
  if (!bracket_is(wl::find_bounding_sections(sections, 0.25), 0, 1, 0.5) ||
      !bracket_is(wl::find_bounding_sections(sections, 0.5), 0, 1, 1.0) ||
      !bracket_is(wl::find_bounding_sections(sections, 0.75), 1, 2, 0.5) ||
      !bracket_is(wl::find_bounding_sections(sections, -1.0), 0, 1, 0.0) ||
      !bracket_is(wl::find_bounding_sections(sections, 2.0), 1, 2, 1.0)) {
    std::cerr << "Section brackets are wrong.\n";
    return 1;
  }

  wl::LoftDefinition tapered = plank();
  tapered.chords = {{0.0, 1.0}, {1.0, 0.5}};
  tapered.twists = {{0.0, 10.0}, {1.0, 0.0}};
  const wl::LoftSpaceTransform transform(tapered);
  if (std::abs(transform.chord(0.5) - 0.75) > 1.0e-12 ||
      std::abs(transform.twist(0.5) - 5.0) > 1.0e-12 || transform.tilt(0.5) != 0.0) {
    std::cerr << "Spanwise distributions are not interpolated linearly.\n";
    return 2;
  }

  const wl::StructuredGrid grid = wl::generate_loft_grid(plank());
  if (!near(wl::get_node(grid, {2, 1, 0}), {1.2, 1.0, 0.1})) {
    const wl::Vec3& p = wl::get_node(grid, {2, 1, 0});
    std::cerr << "Lofted node at " << p[0] << ", " << p[1] << ", " << p[2] << ".\n";
    return 3;
  }
  if (!near(wl::get_node(grid, {0, 2, 0}), {0.2, 2.0, 0.0})) {
    std::cerr << "Tip leading edge is misplaced.\n";
    return 4;
  }

  wl::LoftDefinition twisted = plank();
  twisted.bscale = 1.0;
  twisted.le_x = {{0.0, 0.0}, {1.0, 0.0}};
  twisted.chords = {{0.0, 1.0}, {1.0, 1.0}};
  twisted.twists = {{0.0, 90.0}, {1.0, 90.0}};
  const wl::StructuredGrid turned = wl::generate_loft_grid(twisted);
  if (!near(wl::get_node(turned, {1, 1, 0}), {0.0, 0.5, -1.0})) {
    std::cerr << "Positive twist should turn the chord towards -z.\n";
    return 5;
  }

  wl::LoftDefinition ruled = plank();
  ruled.b_divisions = 5;
  const wl::TriangleSurface surface = wl::generate_loft(ruled);
  if (surface.points.size() != 24 || surface.triangles.size() != 40) {
    std::cerr << "Loft surface has " << surface.points.size() << " points and "
              << surface.triangles.size() << " triangles.\n";
    return 6;
  }

  wl::LoftDefinition blended = plank();
  blended.bscale = 1.0;
  blended.chords = {{0.0, 1.0}, {1.0, 1.0}};
  blended.le_x = {{0.0, 0.0}, {1.0, 0.0}};
  blended.sections[0].contour = {{0.0, 0.0}, {1.0, 0.0}, {1.0, 1.0}, {0.0, 1.0}};
  blended.sections[1].contour = {{0.0, 0.0}, {1.0, 0.0}, {1.0, 3.0}, {0.0, 3.0}};
  const wl::StructuredGrid mid = wl::generate_loft_grid(blended);
  if (!near(wl::get_node(mid, {2, 1, 0}), {1.0, 0.5, 2.0})) {
    std::cerr << "Mid-span contour is not blended between sections.\n";
    return 7;
  }

  wl::LoftDefinition bad = plank();
  bad.sections[1].contour.push_back({0.5, 0.5});
  if (!rejects(bad)) {
    std::cerr << "Differing contour point counts were accepted.\n";
    return 8;
  }
  bad = plank();
  bad.sections[0].position = 1.0;
  bad.sections[1].position = 0.0;
  if (!rejects(bad)) {
    std::cerr << "Unsorted sections were accepted.\n";
    return 9;
  }
  bad = plank();
  bad.sections.pop_back();
  if (!rejects(bad)) {
    std::cerr << "A single section was accepted.\n";
    return 10;
  }
  bad = plank();
  bad.b_divisions = 0;
  if (!rejects(bad)) {
    std::cerr << "Zero span divisions were accepted.\n";
    return 11;
  }

  return 0;
}
