#include "cpsat_backend.h"

#include <iostream>
#include <new>
#include <stdexcept>
#include <vector>

#include <ortools/sat/cp_model.h>
#include <ortools/sat/cp_model.pb.h>
#include <ortools/sat/cp_model_solver.h>
#include <ortools/sat/model.h>
#include <ortools/sat/sat_parameters.pb.h>

using operations_research::sat::BoolVar;
using operations_research::sat::CpModelBuilder;
using operations_research::sat::CpSolverResponse;
using operations_research::sat::CpSolverStatus;
using operations_research::sat::DoubleLinearExpr;
using operations_research::sat::LinearExpr;
using operations_research::sat::Model;
using operations_research::sat::NewSatParameters;
using operations_research::sat::SatParameters;
using operations_research::sat::SolutionBooleanValue;
using operations_research::sat::SolveCpModel;

namespace blm
{

    namespace
    {

        std::vector<BoolVar> gather(const std::vector<BoolVar> &vars, const std::vector<int> &idx)
        {
            std::vector<BoolVar> out;
            out.reserve(idx.size());
            for (int i : idx)
                out.push_back(vars[i]);
            return out;
        }

        // Lower the neutral model onto a CP-SAT builder. Variable i of the
        // model is vars[i] of the builder.
        void build_cp_model(const ConstraintModel &model, CpModelBuilder &cp, std::vector<BoolVar> &vars)
        {
            vars.reserve(model.num_vars());
            for (int i = 0; i < model.num_vars(); ++i)
                vars.push_back(cp.NewBoolVar().WithName(model.name(i)));

            for (const auto &c : model.cardinalities())
            {
                const LinearExpr sum = LinearExpr::Sum(gather(vars, c.vars));
                switch (c.sense)
                {
                case Sense::kEqual:
                    cp.AddEquality(sum, c.rhs);
                    break;
                case Sense::kLessOrEqual:
                    cp.AddLessOrEqual(sum, c.rhs);
                    break;
                case Sense::kGreaterOrEqual:
                    cp.AddGreaterOrEqual(sum, c.rhs);
                    break;
                }
            }

            // Two-way reification: aux => sum >= 1 and !aux => sum == 0.
            for (const auto &e : model.equivalences())
            {
                const BoolVar target = vars[e.target];
                if (e.vars.empty())
                {
                    cp.AddEquality(target, 0);
                    continue;
                }
                const LinearExpr sum = LinearExpr::Sum(gather(vars, e.vars));
                cp.AddGreaterOrEqual(sum, 1).OnlyEnforceIf(target);
                cp.AddEquality(sum, 0).OnlyEnforceIf(target.Not());
            }

            for (const auto &cl : model.clauses())
            {
                std::vector<BoolVar> lits;
                lits.reserve(cl.literals.size());
                for (const auto &l : cl.literals)
                    lits.push_back(l.negated ? vars[l.var].Not() : vars[l.var]);
                cp.AddBoolOr(lits);
            }

            for (const auto &f : model.fixings())
                cp.AddEquality(vars[f.var], f.negated ? 0 : 1);

            if (model.has_objective())
            {
                DoubleLinearExpr obj;
                for (const auto &t : model.objective())
                    obj.AddTerm(vars[t.var], t.coeff);
                cp.Maximize(obj);
            }
        }

    } // namespace

    BackendResult CpSatBackend::solve(const ConstraintModel &model, const BackendParams &params)
    {
        BackendResult out;

        CpModelBuilder cp;
        std::vector<BoolVar> vars;
        build_cp_model(model, cp, vars);

        // ---- Search parameters ----
        SatParameters sp;
        if (params.time_limit_seconds > 0)
            sp.set_max_time_in_seconds(params.time_limit_seconds);
        if (params.num_workers > 0)
            sp.set_num_workers(params.num_workers);
        if (params.random_seed != 0)
            sp.set_random_seed(params.random_seed);
        sp.set_log_search_progress(params.log_search);

        CpSolverResponse response;
        try
        {
            Model sat_model;
            sat_model.Add(NewSatParameters(sp));
            response = SolveCpModel(cp.Build(), &sat_model);
        }
        catch (const std::bad_alloc &)
        {
            out.status = BackendStatus::kError;
            out.error = "CP-SAT ran out of memory";
            return out;
        }

        out.wall_time_seconds = response.wall_time();
        out.stats = operations_research::sat::CpSolverResponseStats(response);

        switch (response.status())
        {
        case CpSolverStatus::OPTIMAL:
            out.status = BackendStatus::kOptimal;
            break;
        case CpSolverStatus::FEASIBLE:
            out.status = BackendStatus::kFeasible;
            break;
        case CpSolverStatus::INFEASIBLE:
            out.status = BackendStatus::kInfeasible;
            return out;
        case CpSolverStatus::MODEL_INVALID:
            throw std::logic_error("CP-SAT rejected the generated model as invalid");
        case CpSolverStatus::UNKNOWN:
            out.status = BackendStatus::kUnknown;
            return out;
        default:
            out.status = BackendStatus::kError;
            out.error = "unexpected CP-SAT status " + std::to_string(static_cast<int>(response.status()));
            return out;
        }

        out.values.reserve(vars.size());
        for (const auto &v : vars)
            out.values.push_back(SolutionBooleanValue(response, v));
        out.objective_value = model.has_objective() ? response.objective_value() : 0.0;

        if (params.log_search)
        {
            std::cerr << "[cp-sat] vars=" << model.num_vars()
                      << " clauses=" << model.clauses().size()
                      << " equivalences=" << model.equivalences().size()
                      << " wall=" << out.wall_time_seconds << "s\n";
        }
        return out;
    }

} // namespace blm
