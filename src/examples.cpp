#include "examples.h"

namespace blm {

namespace {

std::vector<Participant> people(std::initializer_list<const char*> ids) {
  std::vector<Participant> out;
  for (const char* id : ids) out.push_back(Participant{id, 1});
  return out;
}

PreferenceList ranks(std::map<std::string, int> r, bool partial) {
  return PreferenceList::ranked(std::move(r), partial);
}

} // namespace

MatchingProblem example_problem(Variant variant) {
  MatchingProblem p;
  p.proposers = people({"Ishaan", "Cindy", "Thomas"});
  p.receivers = people({"Swapneel", "Zora", "Kevin"});

  switch (variant) {
    case Variant::kTotalOrder:
      p.proposer_prefs = {
          {"Ishaan", PreferenceList::ordered({"Swapneel", "Zora", "Kevin"})},
          {"Cindy", PreferenceList::ordered({"Kevin", "Swapneel", "Zora"})},
          {"Thomas", PreferenceList::ordered({"Zora", "Kevin", "Swapneel"})}};
      p.receiver_prefs = {
          {"Swapneel", PreferenceList::ordered({"Thomas", "Ishaan", "Cindy"})},
          {"Zora", PreferenceList::ordered({"Cindy", "Thomas", "Ishaan"})},
          {"Kevin", PreferenceList::ordered({"Ishaan", "Cindy", "Thomas"})}};
      break;

    case Variant::kRankedTies:
      // Ishaan is indifferent between Swapneel and Zora, Kevin between Ishaan and Cindy
      p.proposer_prefs = {
          {"Ishaan", ranks({{"Swapneel", 1}, {"Kevin", 2}, {"Zora", 1}}, false)},
          {"Cindy", ranks({{"Swapneel", 3}, {"Kevin", 1}, {"Zora", 2}}, false)},
          {"Thomas", ranks({{"Swapneel", 1}, {"Kevin", 2}, {"Zora", 3}}, false)}};
      p.receiver_prefs = {
          {"Swapneel", ranks({{"Ishaan", 2}, {"Cindy", 3}, {"Thomas", 1}}, false)},
          {"Zora", ranks({{"Ishaan", 3}, {"Cindy", 1}, {"Thomas", 2}}, false)},
          {"Kevin", ranks({{"Ishaan", 1}, {"Cindy", 1}, {"Thomas", 2}}, false)}};
      break;

    case Variant::kPartialTies:
      // Ishaan skips Kevin, Thomas skips Zora, Swapneel skips Cindy, Kevin skips Thomas
      p.proposer_prefs = {
          {"Ishaan", ranks({{"Swapneel", 1}, {"Zora", 1}}, true)},
          {"Cindy", ranks({{"Swapneel", 3}, {"Kevin", 1}, {"Zora", 2}}, true)},
          {"Thomas", ranks({{"Swapneel", 1}, {"Kevin", 2}}, true)}};
      p.receiver_prefs = {
          {"Swapneel", ranks({{"Ishaan", 2}, {"Thomas", 1}}, true)},
          {"Zora", ranks({{"Ishaan", 3}, {"Cindy", 1}, {"Thomas", 2}}, true)},
          {"Kevin", ranks({{"Ishaan", 1}, {"Cindy", 1}}, true)}};
      break;

    case Variant::kWeightedOptimize:
      p.proposers[1].capacity = 2;  // Cindy takes twins
      p.receivers.push_back(Participant{"Morgan", 1});
      p.proposer_prefs = {
          {"Ishaan", PreferenceList::ordered({"Swapneel", "Zora", "Kevin", "Morgan"})},
          {"Cindy", PreferenceList::ordered({"Zora", "Swapneel", "Morgan", "Kevin"})},
          {"Thomas", PreferenceList::ordered({"Kevin", "Morgan", "Swapneel", "Zora"})}};
      p.receiver_prefs = {
          {"Swapneel", PreferenceList::ordered({"Ishaan", "Cindy", "Thomas"})},
          {"Zora", PreferenceList::ordered({"Cindy", "Ishaan", "Thomas"})},
          {"Kevin", PreferenceList::ordered({"Thomas", "Ishaan", "Cindy"})},
          {"Morgan", PreferenceList::ordered({"Thomas", "Cindy", "Ishaan"})}};
      break;
  }
  return p;
}

} // namespace blm
