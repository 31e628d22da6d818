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
#pragma once

#include <aspect/term.h>

#include <limits>

/*!
 * \file
 * \brief Rule schemas and programs.
 */
namespace Aspect {
/*!
 * \defgroup program Program
 * \brief Rule schemas, domain declarations, and input facts.
 */
//@{

//! Supported head types.
enum class HeadType : uint8_t {
    constraint  = 0, //!< Empty head: the body must not hold.
    normal      = 1, //!< A single atom.
    disjunctive = 2, //!< At least one of the atoms, minimal.
    choice      = 3, //!< Any subset of the atoms within the given bounds.
};
const char* toString(HeadType t);

//! Bound value used for choice heads without an upper bound.
constexpr uint32_t bound_max = std::numeric_limits<uint32_t>::max();

//! An element "a : l1,...,ln" of a choice head.
/*!
 * The condition may bind variables that are local to the element.
 */
struct HeadElement {
    Atom    atom;
    CondVec condition;
};

//! The head of a rule.
class Head {
public:
    Head() = default;
    static Head normal(Atom a);
    static Head disjunctive(std::vector<Atom> atoms);
    static Head choice(std::vector<HeadElement> elems, uint32_t lower = 0, uint32_t upper = bound_max);

    [[nodiscard]] HeadType                        type() const noexcept { return type_; }
    [[nodiscard]] const std::vector<HeadElement>& elements() const noexcept { return elems_; }
    [[nodiscard]] uint32_t                        lower() const noexcept { return lower_; }
    [[nodiscard]] uint32_t                        upper() const noexcept { return upper_; }
    [[nodiscard]] bool                            empty() const noexcept { return elems_.empty(); }

private:
    HeadType                 type_{HeadType::constraint};
    std::vector<HeadElement> elems_;
    uint32_t                 lower_{0};
    uint32_t                 upper_{bound_max};
};

//! A rule schema "head :- body".
class Rule {
public:
    Rule() = default;
    Rule(Head h, LitVec body) : head_(std::move(h)), body_(std::move(body)) {}

    [[nodiscard]] const Head&   head() const noexcept { return head_; }
    [[nodiscard]] const LitVec& body() const noexcept { return body_; }
    [[nodiscard]] std::string   toString() const;

private:
    Head   head_;
    LitVec body_;
};
std::ostream& operator<<(std::ostream& os, const Rule& r);

//! Incrementally builds a rule.
/*!
 * Usage:
 * \code
 * RuleBuilder rb;
 * prg.addRule(rb.start(HeadType::normal).addHead(atom("a")).addGoal(neg(atom("b"))));
 * \endcode
 */
class RuleBuilder {
public:
    RuleBuilder() = default;

    //! Discards any active rule and starts a new rule with the given head type.
    RuleBuilder& start(HeadType t = HeadType::normal);
    //! Adds a head atom with an optional condition.
    /*!
     * \pre The active rule is not a constraint.
     * \pre Conditions are only given for choice heads.
     */
    RuleBuilder& addHead(Atom a, CondVec cond = {});
    //! Sets the bounds of a choice head.
    RuleBuilder& setBounds(uint32_t lower, uint32_t upper = bound_max);
    //! Adds a body literal.
    RuleBuilder& addGoal(Literal lit);
    //! Returns the active rule and resets the builder.
    Rule         rule();

private:
    HeadType                 type_{HeadType::normal};
    std::vector<HeadElement> head_;
    LitVec                   body_;
    uint32_t                 lower_{0};
    uint32_t                 upper_{bound_max};
};

//! A ground fact given as predicate name and argument tuple.
struct Fact {
    std::string name;
    SymVec      args;
};

//! An ordered collection of rule schemas, domain declarations, and input facts.
class Program {
public:
    Program() = default;

    //! Adds a rule schema and returns its index.
    uint32_t addRule(Rule r);
    uint32_t addRule(RuleBuilder& rb) { return addRule(rb.rule()); }
    uint32_t addRule(Head h, LitVec body) { return addRule(Rule(std::move(h), std::move(body))); }
    //! Adds the integrity constraint ":- body".
    uint32_t addConstraint(LitVec body) { return addRule(Head(), std::move(body)); }

    //! Adds an input fact.
    void addFact(std::string_view pred, SymVec args);
    //! Declares the domain predicate pred/1 holding exactly the integers in [lo, hi].
    void addRange(std::string_view pred, int32_t lo, int32_t hi);
    //! Declares the domain predicate pred/1 holding exactly the given values.
    void addEnum(std::string_view pred, const SymVec& values);

    [[nodiscard]] const std::vector<Rule>& rules() const noexcept { return rules_; }
    [[nodiscard]] const Rule&              rule(uint32_t i) const;
    [[nodiscard]] uint32_t                 numRules() const { return size32(rules_); }
    [[nodiscard]] const std::vector<Fact>& facts() const noexcept { return facts_; }
    [[nodiscard]] bool                     empty() const { return rules_.empty() && facts_.empty(); }
    void                                   clear();

private:
    std::vector<Rule> rules_;
    std::vector<Fact> facts_;
};
std::ostream& operator<<(std::ostream& os, const Program& prg);

//@}
} // namespace Aspect
