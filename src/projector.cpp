//
// Copyright (c) 2006-present Benjamin Kaufmann
//
// This file is part of Aspect.
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to
// deal in the Software without restriction, including without limitation the
// rights to use, copy, modify, merge, publish, distribute, sublicense, and/or
// sell copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
// FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
// IN THE SOFTWARE.
//
#include <aspect/projector.h>

#include <aspect/errors.h>
#include <aspect/instantiator.h>

#include <potassco/error.h>

#include <map>
#include <optional>
#include <ostream>
#include <sstream>

namespace Aspect {
namespace {
// Maximal number of fill values in one sequence.
constexpr uint32_t fill_limit = 1u << 16;
} // namespace
/////////////////////////////////////////////////////////////////////////////////////////
// Projection
/////////////////////////////////////////////////////////////////////////////////////////
const Value* Projection::find(std::string_view name) const {
    auto it = std::find(names_.begin(), names_.end(), name);
    return it != names_.end() ? &values_[static_cast<std::size_t>(it - names_.begin())] : nullptr;
}
const Value& Projection::operator[](std::string_view name) const {
    const auto* v = find(name);
    POTASSCO_CHECK_PRE(v != nullptr, "unknown output");
    return *v;
}
void Projection::print(std::ostream& os) const {
    for (auto i : irange(size())) { os << names_[i] << " = " << values_[i] << '\n'; }
}
/////////////////////////////////////////////////////////////////////////////////////////
// Projector::Node
/////////////////////////////////////////////////////////////////////////////////////////
// A compiled output expression.
struct Projector::Node {
    OutputExpr               expr;
    std::string              path;  // position of the node in the specification, e.g. "grid/content"
    std::string              query; // text of the query for diagnostics
    JoinPlan                 plan;
    uint32_t                 slot{var_none};  // slot of a variable or sequence index
    uint32_t                 ref{UINT32_MAX}; // referenced output
    uint32_t                 local{0};        // first slot bound by the query
    std::vector<std::string> locals;          // variables bound by the query
    std::vector<Node>        children;        // object arguments or [content] / [key, content]
};

Projector::Node Projector::compile(const OutputExpr& e, const VarTable& scope, std::string path,
                                   std::vector<uint32_t>& refs) {
    Node n;
    n.expr = e;
    n.path = std::move(path);
    switch (e.type()) {
        case OutputExpr::Type::literal   :
        case OutputExpr::Type::simple_set: break;
        case OutputExpr::Type::variable:
            if ((n.slot = scope.find(e.name())) == var_none) {
                throw MalformedSpec(n.path, "variable '" + e.name() + "' is not bound by an enclosing query");
            }
            break;
        case OutputExpr::Type::reference:
            if ((n.ref = spec_.find(e.name())) == UINT32_MAX) {
                throw MalformedSpec(n.path, "reference to unknown output '" + e.name() + "'");
            }
            refs.push_back(n.ref);
            break;
        case OutputExpr::Type::object:
            for (auto i : irange(e.args())) {
                n.children.push_back(compile(e.args()[i], scope, n.path + "/" + std::to_string(i), refs));
            }
            break;
        case OutputExpr::Type::set     :
        case OutputExpr::Type::mapping :
        case OutputExpr::Type::sequence: {
            std::ostringstream str;
            str << e.query();
            n.query = str.str();
            VarTable                        vars = scope;
            std::vector<const CondLiteral*> lits;
            for (const auto& c : e.query()) { lits.push_back(&c); }
            n.plan = JoinPlan(prg_->atoms(), lits, vars);
            if (not n.plan.unsafe().empty()) {
                throw MalformedSpec(n.path, "variable '" + n.plan.unsafe() + "' of query '" + n.query +
                                                "' is not bound by a positive atom");
            }
            if (e.type() == OutputExpr::Type::sequence && (n.slot = vars.find(e.name())) == var_none) {
                throw MalformedSpec(n.path, "index '" + e.name() + "' is not a variable of query '" + n.query + "'");
            }
            n.local = scope.size();
            for (auto v : irange(n.local, vars.size())) { n.locals.push_back(vars.name(v)); }
            maxVars_ = std::max(maxVars_, vars.size());
            if (e.type() == OutputExpr::Type::mapping) {
                n.children.push_back(compile(e.key(), vars, n.path + "/key", refs));
            }
            n.children.push_back(compile(e.content(), vars, n.path + "/content", refs));
            break;
        }
    }
    return n;
}

void Projector::checkCycles() const {
    enum State : uint8_t { unvisited, active, done };
    std::vector<State> state(spec_.size(), unvisited);
    auto               visit = [&](auto& self, uint32_t i) -> void {
        if (state[i] == done) {
            return;
        }
        if (state[i] == active) {
            throw MalformedSpec(spec_.name(i), "cyclic reference");
        }
        state[i] = active;
        for (auto j : deps_[i]) { self(self, j); }
        state[i] = done;
    };
    for (auto i : irange(spec_.size())) { visit(visit, i); }
}

Projector::Projector(const GroundProgram& prg, const OutputSpecification& spec) : prg_(&prg), spec_(spec) {
    deps_.resize(spec_.size());
    for (auto i : irange(spec_.size())) { roots_.push_back(compile(spec_.expr(i), VarTable(), spec_.name(i), deps_[i])); }
    checkCycles();
}
Projector::~Projector()                    = default;
Projector::Projector(Projector&&) noexcept = default;
/////////////////////////////////////////////////////////////////////////////////////////
// Projector::Eval
/////////////////////////////////////////////////////////////////////////////////////////
// Evaluation of compiled outputs over one answer set.
struct Projector::Eval {
    // Join policy matching positive query atoms against the answer set.
    struct InModel {
        [[nodiscard]] std::pair<Atom_t, Atom_t> range(uint32_t) const { return {0, size32(*inM)}; }
        [[nodiscard]] bool                      accept(Atom_t a) const { return (*inM)[a] != 0; }
        [[nodiscard]] bool holdsNot(Atom_t a) const { return a == atom_none || (*inM)[a] == 0; }
        const std::vector<uint8_t>* inM;
    };

    Eval(const Projector& p, const Model& m) : self(&p), atoms(&p.prg_->atoms()), outputs(p.spec_.size()) {
        inM.assign(atoms->size(), 0);
        for (auto a : m.atoms) { inM[a] = 1; }
    }

    const Value& output(uint32_t i) {
        if (not outputs[i]) {
            Binding b(self->maxVars_);
            outputs[i] = value(self->roots_[i], b);
        }
        return *outputs[i];
    }

    template <typename OnMatch>
    void forEach(const Node& n, Binding& b, OnMatch&& onMatch) {
        join(*atoms, n.plan, b, InModel{&inM}, std::forward<OnMatch>(onMatch));
    }

    Value value(const Node& n, Binding& b) {
        const auto& e = n.expr;
        switch (e.type()) {
            case OutputExpr::Type::literal  : return {e.value()};
            case OutputExpr::Type::variable : return {b[n.slot]};
            case OutputExpr::Type::reference: return output(n.ref);
            case OutputExpr::Type::object: {
                std::vector<Value> args;
                for (const auto& c : n.children) { args.push_back(value(c, b)); }
                return Value::tuple(std::move(args), e.name());
            }
            case OutputExpr::Type::simple_set: return simpleSet(e.name());
            case OutputExpr::Type::set: {
                std::vector<Value> elems;
                forEach(n, b, [&]() { elems.push_back(value(n.children.back(), b)); });
                return Value::set(std::move(elems));
            }
            case OutputExpr::Type::mapping : return mapping(n, b);
            case OutputExpr::Type::sequence: return sequence(n, b);
        }
        POTASSCO_ASSERT_NOT_REACHED("invalid expression type");
    }

    Value simpleSet(const std::string& pred) const {
        std::vector<Value> elems;
        for (auto p : irange(atoms->numPredicates())) {
            if (atoms->predicate(p).name != pred) {
                continue;
            }
            for (auto a : atoms->atoms(p)) {
                if (inM[a]) {
                    const auto&        args = atoms->args(a);
                    std::vector<Value> tuple(args.begin(), args.end());
                    elems.push_back(Value::tuple(std::move(tuple)));
                }
            }
        }
        return Value::set(std::move(elems));
    }

    // Values of the variables bound by the query of n.
    static SymVec locals(const Node& n, const Binding& b) {
        SymVec out;
        for (auto i : irange(n.locals)) { out.push_back(b[n.local + i]); }
        return out;
    }
    // Text of the variables whose values differ in x and y, e.g. "V=30".
    static std::pair<std::string, std::string> difference(const Node& n, const SymVec& x, const SymVec& y) {
        std::ostringstream lhs, rhs;
        const char*        sep = "";
        for (auto i : irange(x)) {
            if (x[i] != y[i]) {
                lhs << sep << n.locals[i] << '=' << Value(x[i]);
                rhs << sep << n.locals[i] << '=' << Value(y[i]);
                sep = ", ";
            }
        }
        return {lhs.str(), rhs.str()};
    }

    // A key must stem from exactly one binding of the query.
    template <typename Key>
    void add(const Node& n, Binding& b, std::map<Key, std::pair<SymVec, Value>>& entries, Key k,
             const std::string& keyText) {
        auto vars = locals(n, b);
        auto it   = entries.find(k);
        if (it == entries.end()) {
            entries.emplace(std::move(k), std::make_pair(std::move(vars), value(n.children.back(), b)));
        }
        else if (it->second.first != vars) {
            auto [first, second] = difference(n, it->second.first, vars);
            throw AmbiguousKey(n.path, n.query, keyText, first, second);
        }
    }

    Value mapping(const Node& n, Binding& b) {
        std::map<Value, std::pair<SymVec, Value>> entries;
        forEach(n, b, [&]() {
            auto k    = value(n.children.front(), b);
            auto text = toString(k);
            add(n, b, entries, std::move(k), text);
        });
        std::vector<Value> keys, values;
        for (auto& [k, v] : entries) {
            keys.push_back(k);
            values.push_back(std::move(v.second));
        }
        return Value::mapping(std::move(keys), std::move(values));
    }

    Value sequence(const Node& n, Binding& b) {
        std::map<int32_t, std::pair<SymVec, Value>> entries;
        forEach(n, b, [&]() {
            const auto& idx = b[n.slot];
            if (not idx.isNumber()) {
                throw TypeMismatch("sequence index of '" + n.path + "'", toString(idx), "number");
            }
            if (idx.num() < 0) {
                throw MalformedSpec(n.path, "negative index " + std::to_string(idx.num()) + " of query '" + n.query + "'");
            }
            add(n, b, entries, idx.num(), std::to_string(idx.num()));
        });
        std::vector<Value> elems;
        const auto&        fill   = n.expr.fill();
        uint32_t           filled = 0;
        for (auto& [i, v] : entries) {
            while (size32(elems) < static_cast<uint32_t>(i)) {
                if (not fill || filled == fill_limit) {
                    throw MissingIndex(n.path, n.query, static_cast<int32_t>(elems.size()));
                }
                elems.emplace_back(*fill);
                ++filled;
            }
            elems.push_back(std::move(v.second));
        }
        return Value::sequence(std::move(elems));
    }

    const Projector*                  self;
    const AtomTable*                  atoms;
    std::vector<uint8_t>              inM;
    std::vector<std::optional<Value>> outputs;
};

Projection Projector::project(const Model& m, EventHandler* h) const {
    POTASSCO_CHECK_PRE(m.prg == prg_, "model does not belong to the program of this projector");
    Eval       eval(*this, m);
    Projection res;
    for (auto i : irange(spec_.size())) {
        res.names_.push_back(spec_.name(i));
        res.values_.push_back(eval.output(i));
    }
    log(h, Event::subsystem_project, Event::verbosity_high, nullptr, "projected %u outputs of model %llu", res.size(),
        static_cast<unsigned long long>(m.num));
    return res;
}

Value Projector::project(const Model& m, std::string_view output) const {
    POTASSCO_CHECK_PRE(m.prg == prg_, "model does not belong to the program of this projector");
    auto i = spec_.find(output);
    POTASSCO_CHECK_PRE(i != UINT32_MAX, "unknown output");
    Eval eval(*this, m);
    return eval.output(i);
}

} // namespace Aspect
