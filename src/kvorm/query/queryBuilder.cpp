#include "queryBuilder.h"

#include "../model/model.h"

QueryBuilder &QueryBuilder::sort(const std::string &field, SortOrder order) {
	_plan.sort = SortSpec{field, order};
	return *this;
}

QueryBuilder &QueryBuilder::skip(size_t n) {
	_plan.skip = n;
	return *this;
}

QueryBuilder &QueryBuilder::limit(size_t n) {
	_plan.limit = n;
	return *this;
}

DbResult<std::vector<JsonDocument>> QueryBuilder::exec() const {
	return _model->find(_plan);
}

DbResult<size_t> QueryBuilder::count() const {
	return _model->count(_plan);
}

DbResult<JsonDocument> QueryBuilder::first() const {
	return _model->findOne(_plan);
}
