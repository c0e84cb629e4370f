#include "backtest/run_name.hpp"

#include <array>

namespace backtest {
namespace {

constexpr std::array<const char*, 20> kColors = {
    "Red", "Blue", "Green", "Yellow", "Black", "White", "Purple", "Orange", "Brown", "Grey",
    "Pink", "Violet", "Crimson", "Turquoise", "Gold", "Silver", "Amber", "Magenta", "Teal", "Indigo"};

constexpr std::array<const char*, 20> kAnimals = {
    "Eagle", "Tiger", "Lion", "Wolf", "Bear", "Falcon", "Shark", "Panther", "Leopard", "Cheetah",
    "Hawk", "Fox", "Owl", "Cobra", "Jaguar", "Horse", "Elephant", "Dolphin", "Gorilla", "Lynx"};

constexpr std::array<const char*, 20> kProfessions = {
    "Carpenter", "Engineer", "Doctor", "Pilot", "Farmer", "Artist", "Blacksmith", "Chef", "Teacher", "Mechanic",
    "Architect", "Scientist", "Soldier", "Nurse", "Firefighter", "Plumber", "Astronaut", "Tailor", "Photographer",
    "Lawyer"};

template <std::size_t N>
const char* pick(const std::array<const char*, N>& words, std::mt19937& rng) {
    std::uniform_int_distribution<std::size_t> dist(0, N - 1);
    return words[dist(rng)];
}

} // namespace

std::string generate_run_name(std::mt19937& rng) {
    std::string name = pick(kColors, rng);
    name += pick(kAnimals, rng);
    name += pick(kProfessions, rng);
    return name;
}

std::string generate_run_name() {
    static std::mt19937 rng{std::random_device{}()};
    return generate_run_name(rng);
}

} // namespace backtest
