#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <memory>
#include <optional>
#include "BettingEngine.h"
#include "Hand.h"
#include "Messages.h"

namespace py = pybind11;

// Helper to convert nlohmann::json to py::object
py::object json_to_py(const nlohmann::json& j) {
    if (j.is_null()) {
        return py::none();
    } else if (j.is_boolean()) {
        return py::bool_(j.get<bool>());
    } else if (j.is_number_integer()) {
        return py::int_(j.get<nlohmann::json::number_integer_t>());
    } else if (j.is_number_float()) {
        return py::float_(j.get<double>());
    } else if (j.is_string()) {
        return py::str(j.get<std::string>());
    } else if (j.is_array()) {
        py::list l;
        for (const auto& item : j) {
            l.append(json_to_py(item));
        }
        return l;
    } else if (j.is_object()) {
        py::dict d;
        for (auto it = j.begin(); it != j.end(); ++it) {
            d[py::str(it.key())] = json_to_py(it.value());
        }
        return d;
    }
    return py::none();
}

/**
 * A table without the networking: a fixed set of players who play hand
 * after hand, with stacks and dealer position carried between hands.
 */
class Simulation {
public:
    Simulation(const std::vector<std::string>& names, int chips,
               const BettingEngine::Config& cfg)
        : config(cfg), dealerIndex(-1) {
        for (const auto& name : names) {
            players.push_back(std::make_shared<Player>(name, chips));
        }
    }
    
    bool startHand() {
        engine = std::make_unique<BettingEngine>(players, dealerIndex, config);
        if (!engine->startHand()) {
            engine.reset();
            return false;
        }
        dealerIndex = engine->getDealerIndex();
        return true;
    }
    
    // Returns None when accepted, otherwise the refusal message
    std::optional<std::string> act(const std::string& name, const PlayerAction& action) {
        if (!engine) {
            return std::string(errorMessage(ActionError::NO_HAND_IN_PROGRESS));
        }
        ActionError error = engine->takeAction(name, action);
        if (error == ActionError::NONE) {
            return std::nullopt;
        }
        return std::string(errorMessage(error));
    }
    
    py::dict state() const {
        if (!engine) {
            return py::dict();
        }
        return json_to_py(Messages::update(*engine, "")).cast<py::dict>();
    }
    
    py::object settlement() const {
        if (!engine || !engine->getSettlement()) {
            return py::none();
        }
        return json_to_py(Messages::showdown(*engine->getSettlement()));
    }
    
    std::vector<Card> holeCards(const std::string& name) const {
        for (const auto& player : players) {
            if (player->getName() == name) {
                return player->getHoleCards();
            }
        }
        throw std::invalid_argument("Unknown player: " + name);
    }
    
    int chips(const std::string& name) const {
        for (const auto& player : players) {
            if (player->getName() == name) {
                return player->getChips();
            }
        }
        throw std::invalid_argument("Unknown player: " + name);
    }
    
    bool isComplete() const { return !engine || engine->isComplete(); }

private:
    std::vector<std::shared_ptr<Player>> players;
    BettingEngine::Config config;
    std::unique_ptr<BettingEngine> engine;
    int dealerIndex;
};

py::tuple evaluate_hand(const std::vector<std::string>& codes) {
    std::vector<Card> cards;
    cards.reserve(codes.size());
    for (const auto& code : codes) {
        cards.emplace_back(code);
    }
    Hand::EvaluatedHand hand = Hand::evaluate(cards);
    return py::make_tuple(hand.getCategory(), hand.tiebreakers, hand.getRankingName());
}

PYBIND11_MODULE(holdem_binding, m) {
    m.doc() = "Hold'em betting engine and hand evaluator bindings";
    
    py::class_<Card>(m, "Card")
        .def(py::init<std::string_view>())
        .def("rank", &Card::getRankValue)
        .def("suit", &Card::getSuitValue)
        .def("__str__", &Card::toString)
        .def("__repr__", &Card::toLongString);
    
    m.def("evaluate_hand", &evaluate_hand,
        "Score 2-7 cards given as codes like 'AS'.\n\n"
        "Returns (category 1-9, tiebreakers, ranking name).",
        py::arg("cards"));
    
    py::class_<BettingEngine::Config>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("small_blind", &BettingEngine::Config::smallBlind)
        .def_readwrite("big_blind", &BettingEngine::Config::bigBlind)
        .def_readwrite("seed", &BettingEngine::Config::seed)
        .def_readwrite("exact_cards", &BettingEngine::Config::exactCards);
    
    py::class_<Simulation>(m, "Simulation")
        .def(py::init<const std::vector<std::string>&, int, const BettingEngine::Config&>(),
             py::arg("players"), py::arg("chips") = 1000,
             py::arg("config") = BettingEngine::Config())
        .def("start_hand", &Simulation::startHand)
        .def("fold", [](Simulation& self, const std::string& name) {
            return self.act(name, FoldAction{});
        })
        .def("bet", [](Simulation& self, const std::string& name, int amount) {
            return self.act(name, BetAction{amount});
        }, py::arg("name"), py::arg("amount") = 0)
        .def("state", &Simulation::state)
        .def("settlement", &Simulation::settlement)
        .def("hole_cards", &Simulation::holeCards)
        .def("chips", &Simulation::chips)
        .def("is_complete", &Simulation::isComplete);
}
