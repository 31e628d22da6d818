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

#include <aspect/output_spec.h>
#include <aspect/solver_types.h>
#include <aspect/value.h>

#include <memory>

/*!
 * \file
 * \brief Evaluation of output specifications over answer sets.
 */
namespace Aspect {
/*!
 * \addtogroup project
 */
//@{
class VarTable;

//! The values of all named outputs of an output specification.
class Projection {
public:
    [[nodiscard]] uint32_t           size() const { return size32(names_); }
    [[nodiscard]] bool               empty() const { return names_.empty(); }
    [[nodiscard]] const std::string& name(uint32_t i) const { return names_[i]; }
    [[nodiscard]] const Value&       value(uint32_t i) const { return values_[i]; }
    //! Returns the value of the output with the given name or nullptr.
    [[nodiscard]] const Value*       find(std::string_view name) const;
    //! Returns the value of the output with the given name.
    /*!
     * \pre find(name) != nullptr
     */
    [[nodiscard]] const Value&       operator[](std::string_view name) const;
    //! Writes one "name = value" line per output.
    void                             print(std::ostream& os) const;

private:
    friend class Projector;
    std::vector<std::string> names_;
    std::vector<Value>       values_;
};

//! Interpreter of an output specification.
/*!
 * The projector compiles the queries of an output specification once against
 * the atom table of a ground program. Queries are then matched against an
 * answer set with the join machinery of the grounder, where positive query
 * atoms only match atoms of the answer set and negative query atoms hold iff
 * their atom is not in the answer set.
 */
class Projector {
public:
    /*!
     * \throw MalformedSpec if the specification uses an unknown variable or
     *        reference, has a cyclic reference, a sequence index that is not a
     *        variable of its query, or a query variable that is not bound by
     *        a positive query atom.
     */
    Projector(const GroundProgram& prg, const OutputSpecification& spec);
    ~Projector();
    Projector(Projector&&) noexcept;

    //! Evaluates all outputs over the given answer set.
    /*!
     * \pre m belongs to the program of this projector.
     * \throw MissingIndex if a sequence has a gap in its indices that is not covered by its fill value.
     * \throw AmbiguousKey if a mapping key or sequence index stems from more than one binding of its query.
     * \throw TypeMismatch if a sequence index is not a number.
     */
    [[nodiscard]] Projection project(const Model& m, EventHandler* h = nullptr) const;
    //! Evaluates only the output with the given name (and the outputs it references).
    [[nodiscard]] Value      project(const Model& m, std::string_view output) const;

    [[nodiscard]] const OutputSpecification& spec() const noexcept { return spec_; }

private:
    struct Node;
    struct Eval;
    Node compile(const OutputExpr& e, const VarTable& scope, std::string path, std::vector<uint32_t>& refs);
    void checkCycles() const;

    const GroundProgram*               prg_;
    OutputSpecification                spec_;
    std::vector<Node>                  roots_;
    std::vector<std::vector<uint32_t>> deps_; // output -> referenced outputs
    uint32_t                           maxVars_{0};
};

//@}
} // namespace Aspect
